#include "starmap/editing/RouteEditTypes.h"

namespace starmap {

std::string errorTitle(RouteEditError error) {
    switch (error) {
        case RouteEditError::None: return "OK";
        case RouteEditError::SameSystem: return "Same System";
        case RouteEditError::DuplicateRoute: return "Duplicate Route";
        case RouteEditError::BelowMinimumSystems: return "Cannot Remove System";
        case RouteEditError::SystemAlreadyInRoute: return "System Already In Route";
        case RouteEditError::SplitAtEndpoint: return "Cannot Split";
        case RouteEditError::NoSharedEndpoint: return "Cannot Merge";
        case RouteEditError::EmptySelection: return "No Routes Selected";
        case RouteEditError::MissingSystemReference: return "Missing System";
        case RouteEditError::UnknownSystem: return "Unknown System";
        case RouteEditError::SystemNotInRoute: return "System Not In Route";
        case RouteEditError::ChainModeUnsupported: return "Not Available For Chains";
        case RouteEditError::InvalidIndex: return "Invalid Index";
        case RouteEditError::RouteNotFound: return "Route Not Found";
        case RouteEditError::GroupNotFound: return "Group Not Found";
    }
    return "Error";
}

std::string toString(RouteEditError error) {
    switch (error) {
        case RouteEditError::None: return "None";
        case RouteEditError::SameSystem: return "SameSystem";
        case RouteEditError::DuplicateRoute: return "DuplicateRoute";
        case RouteEditError::BelowMinimumSystems: return "BelowMinimumSystems";
        case RouteEditError::SystemAlreadyInRoute: return "SystemAlreadyInRoute";
        case RouteEditError::SplitAtEndpoint: return "SplitAtEndpoint";
        case RouteEditError::NoSharedEndpoint: return "NoSharedEndpoint";
        case RouteEditError::EmptySelection: return "EmptySelection";
        case RouteEditError::MissingSystemReference: return "MissingSystemReference";
        case RouteEditError::UnknownSystem: return "UnknownSystem";
        case RouteEditError::SystemNotInRoute: return "SystemNotInRoute";
        case RouteEditError::ChainModeUnsupported: return "ChainModeUnsupported";
        case RouteEditError::InvalidIndex: return "InvalidIndex";
        case RouteEditError::RouteNotFound: return "RouteNotFound";
        case RouteEditError::GroupNotFound: return "GroupNotFound";
    }
    return "Unknown";
}

}  // namespace starmap
