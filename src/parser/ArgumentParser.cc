#include "spill/parser/ArgumentParser.hh"

#include <algorithm>
#include <sstream>

namespace spill {

void ArgumentParser::addArgument(const std::string& name, const std::string& description, bool takesValue) {
    options_.push_back(Option{name, description, takesValue});
}

void ArgumentParser::parse(int argc, const char* const argv[]) {
    values_.clear();
    errors_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];
        auto it = std::find_if(options_.begin(), options_.end(), [&](const Option& o) { return o.name == token; });
        if (it == options_.end()) {
            errors_.push_back("Unknown option: " + token);
            continue;
        }

        if (!it->takesValue) {
            values_[token] = "";
            continue;
        }
        if (i + 1 >= argc) {
            errors_.push_back("Missing value for " + token);
            continue;
        }
        values_[token] = argv[++i];
    }
}

bool ArgumentParser::hasArgument(const std::string& name) const {
    return values_.count(name) > 0;
}

std::string ArgumentParser::getArgument(const std::string& name, const std::string& fallback) const {
    auto it = values_.find(name);
    return it != values_.end() ? it->second : fallback;
}

std::string ArgumentParser::usage(std::string_view executable) const {
    std::ostringstream oss;
    oss << "Usage: " << executable << " [options]\n";
    oss << "Options:\n";
    for (const auto& option : options_) {
        std::string label = option.name + (option.takesValue ? " <value>" : "");
        oss << "  " << label;
        if (label.size() < 22) {
            oss << std::string(22 - label.size(), ' ');
        } else {
            oss << ' ';
        }
        oss << option.description << "\n";
    }
    return oss.str();
}

} // namespace spill
