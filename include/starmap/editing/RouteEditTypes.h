#pragma once

#include <optional>
#include <string>
#include <utility>

namespace starmap {

/// Reasons an editing operation is rejected
///
/// Every rejection is a no-op on the original data and is surfaced to the
/// user as a message, never as a crash.
enum class RouteEditError {
    None,
    SameSystem,             ///< Route from a system to itself
    DuplicateRoute,         ///< A route already connects the same unordered pair
    BelowMinimumSystems,    ///< Removal would leave fewer than 2 members
    SystemAlreadyInRoute,   ///< Inserted (or merged) system is already a member
    SplitAtEndpoint,        ///< Split requested at the first or last member
    NoSharedEndpoint,       ///< Merge between routes with no common endpoint
    EmptySelection,         ///< Group creation with zero routes
    MissingSystemReference, ///< Geometry needs a system absent from the lookup
    UnknownSystem,          ///< Operation would create a dangling system reference
    SystemNotInRoute,       ///< Remove or split names a non-member system
    ChainModeUnsupported,   ///< Shape editing on a chain route
    InvalidIndex,           ///< Shape-point or insert index out of range
    RouteNotFound,
    GroupNotFound
};

/// Short title for an error code, e.g. "Duplicate Route"
std::string errorTitle(RouteEditError error);

/// Enum name for logs, e.g. "DuplicateRoute"
std::string toString(RouteEditError error);

/// Outcome of an editing operation
/// Holds the produced value on success, or an error code and a reason.
template <typename T>
struct RouteEditResult {
    std::optional<T> value;
    RouteEditError error = RouteEditError::None;
    std::string reason;     ///< Human-readable failure reason if !success()

    bool success() const { return value.has_value(); }
    explicit operator bool() const { return success(); }

    static RouteEditResult ok(T v) {
        RouteEditResult result;
        result.value = std::move(v);
        return result;
    }

    static RouteEditResult fail(RouteEditError err, std::string why) {
        RouteEditResult result;
        result.error = err;
        result.reason = std::move(why);
        return result;
    }

    /// Re-wrap a failure of another result type
    template <typename U>
    static RouteEditResult fail(const RouteEditResult<U>& other) {
        return fail(other.error, other.reason);
    }
};

}  // namespace starmap
