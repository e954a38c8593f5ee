#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <string>

namespace dct_redux {

namespace fs = std::filesystem;

// Matrix types (rows = detector rows, cols = detector columns)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;

// Role of a frame in the calibration scheme
enum class FrameRole {
    BIAS = 0,
    FLAT = 1,
    SCIENCE = 2
};

inline std::string frame_role_to_string(FrameRole role) {
    switch (role) {
        case FrameRole::BIAS: return "BIAS";
        case FrameRole::FLAT: return "FLAT";
        case FrameRole::SCIENCE: return "SCIENCE";
        default: return "UNKNOWN";
    }
}

// Element-wise frame combination
enum class CombineOp {
    ADD,
    SUBTRACT,
    DIVIDE
};

inline std::string combine_op_to_string(CombineOp op) {
    switch (op) {
        case CombineOp::ADD: return "ADD";
        case CombineOp::SUBTRACT: return "SUBTRACT";
        case CombineOp::DIVIDE: return "DIVIDE";
        default: return "UNKNOWN";
    }
}

// Display stretch family used by rescale
enum class StretchMode {
    LINEAR,
    LOG,
    POWER
};

inline std::string stretch_mode_to_string(StretchMode mode) {
    switch (mode) {
        case StretchMode::LINEAR: return "linear";
        case StretchMode::LOG: return "log";
        case StretchMode::POWER: return "power";
        default: return "unknown";
    }
}

// Column span [begin, end) of the raw readout
struct ColumnRange {
    int begin;
    int end;

    int width() const { return end - begin; }
};

// Pipeline phase enumeration
enum class Phase {
    SCAN_INPUT = 0,
    MASTER_BIAS = 1,
    MASTER_FLAT = 2,
    SCIENCE_CALIBRATION = 3,
    COMBINE = 4,
    DONE = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::MASTER_BIAS: return "MASTER_BIAS";
        case Phase::MASTER_FLAT: return "MASTER_FLAT";
        case Phase::SCIENCE_CALIBRATION: return "SCIENCE_CALIBRATION";
        case Phase::COMBINE: return "COMBINE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace dct_redux
