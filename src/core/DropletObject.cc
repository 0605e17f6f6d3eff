#include "spill/core/DropletObject.hh"

namespace spill {

std::string kindToString(DropletKind kind) {
    switch (kind) {
        case DropletKind::Default: return "Default";
        case DropletKind::Decal:   return "Decal";
        default:                   return "Unknown";
    }
}

std::optional<DropletKind> kindFromString(std::string_view name) {
    if (name == "Default") {
        return DropletKind::Default;
    }
    if (name == "Decal") {
        return DropletKind::Decal;
    }
    return std::nullopt;
}

std::string DropletObject::stateToString(DropletState state) {
    switch (state) {
        case DropletState::Pooled:    return "Pooled";
        case DropletState::Flying:    return "Flying";
        case DropletState::Landed:    return "Landed";
        case DropletState::Merging:   return "Merging";
        case DropletState::Expanding: return "Expanding";
        case DropletState::Decaying:  return "Decaying";
        default:                      return "Unknown";
    }
}

std::shared_ptr<const TransitionTable<DropletState>> DropletObject::transitionTable() {
    static const std::shared_ptr<const TransitionTable<DropletState>> table = [] {
        auto t = std::make_shared<TransitionTable<DropletState>>();

        t->add(DropletState::Pooled, DropletState::Flying);

        // A cast may also terminate without impact and recycle directly
        t->add(DropletState::Flying, DropletState::Landed);
        t->add(DropletState::Flying, DropletState::Merging);
        t->add(DropletState::Flying, DropletState::Pooled);

        t->add(DropletState::Merging, DropletState::Pooled);

        t->add(DropletState::Landed, DropletState::Expanding);
        t->add(DropletState::Landed, DropletState::Decaying);

        t->add(DropletState::Expanding, DropletState::Landed);
        t->add(DropletState::Expanding, DropletState::Decaying);

        t->add(DropletState::Decaying, DropletState::Pooled);
        return std::shared_ptr<const TransitionTable<DropletState>>(std::move(t));
    }();
    return table;
}

DropletObject::DropletObject(ObjectId id, const DropletTemplate& tmpl)
    : id_(id),
      template_(tmpl),
      size_(tmpl.size),
      transparency_(tmpl.transparency),
      anchored_(tmpl.anchored),
      state_(DropletState::Pooled, transitionTable(), &DropletObject::stateToString) {}

void DropletObject::resetToTemplate() {
    weld_.reset();
    size_ = template_.size;
    transparency_ = template_.transparency;
    anchored_ = template_.anchored;
    visible_ = false;
    trailEnabled_ = false;
    parented_ = false;
    pose_ = Transformf();
    ++generation_;
    state_.reset(DropletState::Pooled);
}

} // namespace spill
