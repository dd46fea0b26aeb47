#include "risk_types.hpp"

const char* toString(RiskKind kind) {
    switch (kind) {
        case RiskKind::Threat:
            return "threat";
        case RiskKind::Opportunity:
            return "opportunity";
    }
    return "unknown";
}

const char* toString(DistributionModel model) {
    switch (model) {
        case DistributionModel::Triangular:
            return "triangular";
        case DistributionModel::Pert:
            return "pert";
        case DistributionModel::Normal:
            return "normal";
        case DistributionModel::Uniform:
            return "uniform";
    }
    return "unknown";
}
