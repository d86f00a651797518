#pragma once

#include <cstdint>
#include <string>

namespace starmap {

/// Sequential ID source: "<prefix>-000001", "<prefix>-000002", ...
class IdGenerator {
public:
    explicit IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

    std::string next();

    /// Advance past an existing ID so later next() calls never collide with it
    /// IDs without this generator's prefix or a numeric suffix are ignored.
    void observe(const std::string& existingId);

    void reset() { counter_ = 0; }
    uint64_t counter() const { return counter_; }

private:
    std::string prefix_;
    uint64_t counter_ = 0;
};

}  // namespace starmap
