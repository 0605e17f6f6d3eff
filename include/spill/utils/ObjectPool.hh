#pragma once

#include "spill/utils/ErrorHandling.hh"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace spill {

// Bounded recycler of heap objects with borrow/return semantics.
// Objects are created lazily by the factory up to a hard limit and are never
// destroyed until clear() or pool destruction, so handed-out pointers stay
// valid across acquire/release cycles.
// Not thread-safe: owned by one single-threaded engine.
template <typename T> class ObjectPool {
  public:
    using Factory = std::function<std::unique_ptr<T>()>;
    using ResetFn = std::function<void(T&)>;

    ObjectPool(size_t limit, size_t initialCount, Factory factory, ResetFn reset = {})
        : limit_(limit), factory_(std::move(factory)), reset_(std::move(reset)) {
        if (!factory_) {
            throwError("ObjectPool requires a factory");
        }
        objects_.reserve(limit_);
        freeList_.reserve(limit_);
        grow(initialCount);
    }

    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;

    // Pops a free object, growing by one when the free list is empty and
    // the limit allows. ResourceExhausted otherwise.
    Result<T*> acquire() {
        if (freeList_.empty() && growthEnabled_) {
            grow(1);
        }
        if (freeList_.empty()) {
            return Result<T*>::error(ErrorCode::ResourceExhausted,
                                     "ObjectPool exhausted (" + std::to_string(inUse_.size()) + "/" +
                                         std::to_string(limit_) + " in use)");
        }

        T* obj = freeList_.back();
        freeList_.pop_back();
        inUse_.insert(obj);
        return Result<T*>::ok(obj);
    }

    // Returns an in-use object and runs the reset callback on it.
    // Unknown or already-free objects are ignored and report false.
    bool release(T* obj) {
        auto it = inUse_.find(obj);
        if (it == inUse_.end()) {
            return false;
        }
        inUse_.erase(it);
        if (reset_) {
            reset_(*obj);
        }
        freeList_.push_back(obj);
        return true;
    }

    // Creates up to `count` new free objects without exceeding the limit.
    // Returns how many were created.
    size_t grow(size_t count) {
        size_t created = 0;
        while (created < count && objects_.size() < limit_) {
            auto obj = factory_();
            if (!obj) {
                break;
            }
            freeList_.push_back(obj.get());
            objects_.push_back(std::move(obj));
            ++created;
        }
        return created;
    }

    bool isInUse(const T* obj) const { return inUse_.count(const_cast<T*>(obj)) > 0; }

    // Destroys every object, including ones still handed out.
    void clear() {
        inUse_.clear();
        freeList_.clear();
        objects_.clear();
    }

    void setGrowthEnabled(bool enabled) { growthEnabled_ = enabled; }
    bool growthEnabled() const { return growthEnabled_; }

    size_t freeCount() const { return freeList_.size(); }
    size_t inUseCount() const { return inUse_.size(); }
    size_t totalCreated() const { return objects_.size(); }
    size_t limit() const { return limit_; }

  private:
    size_t limit_;
    Factory factory_;
    ResetFn reset_;
    bool growthEnabled_ = true;
    std::vector<std::unique_ptr<T>> objects_;
    std::vector<T*> freeList_;
    std::unordered_set<T*> inUse_;
};

} // namespace spill
