#include "dct_redux/frame/calibrated_frame.hpp"
#include "dct_redux/core/errors.hpp"
#include "dct_redux/image/geometry.hpp"
#include "dct_redux/image/overscan.hpp"

#include <sstream>
#include <utility>

namespace dct_redux::frame {

namespace {

std::string shape_string(const Matrix2Df& m) {
    return std::to_string(m.cols()) + "x" + std::to_string(m.rows());
}

bool same_shape(const Matrix2Df& a, const Matrix2Df& b) {
    return a.rows() == b.rows() && a.cols() == b.cols();
}

bool has_zero(const Matrix2Df& m) {
    return m.size() > 0 && (m.array() == 0.0f).any();
}

void apply_op(Matrix2Df& lhs, const Matrix2Df& rhs, CombineOp op) {
    switch (op) {
        case CombineOp::ADD:
            lhs += rhs;
            break;
        case CombineOp::SUBTRACT:
            lhs -= rhs;
            break;
        case CombineOp::DIVIDE:
            lhs = (lhs.array() / rhs.array()).matrix();
            break;
    }
}

} // namespace

CalibratedFrame::CalibratedFrame(FrameRole role, std::string name, io::HeaderRecord header,
                                 const Matrix2Df& raw, const FrameOptions& options)
    : token_(role) {
    const image::FrameGeometry geometry = image::compute_frame_geometry(header);
    image::FrameRegions regions = image::split_regions(raw, geometry);

    prescan_ = std::move(regions.prescan);
    postscan_ = std::move(regions.postscan);
    active_ = image::correct_overscan(regions.active, prescan_, postscan_,
                                      options.subtract_overscan);

    if (options.remove_cosmic_rays) {
        static const image::NullCosmicRayFilter no_op;
        const image::CosmicRayFilter& filter =
            options.cosmic_ray_filter ? *options.cosmic_ray_filter : no_op;
        active_ = image::filter_cosmic_rays(filter, active_);
    }

    original_ = active_;
    names_.push_back(std::move(name));
    headers_.push_back(std::move(header));
}

CalibratedFrame CalibratedFrame::load(FrameRole role, const fs::path& path,
                                      const FrameOptions& options) {
    io::RawFrame raw = io::read_raw_frame(path);
    return CalibratedFrame(role, std::move(raw.name), std::move(raw.header), raw.data, options);
}

void CalibratedFrame::require_same_shape(const CalibratedFrame& other,
                                         const char* operation) const {
    auto check = [&](const char* region, const Matrix2Df& a, const Matrix2Df& b) {
        if (!same_shape(a, b)) {
            throw ShapeMismatchError(std::string(operation) + ": " + region + " " +
                                     shape_string(a) + " vs " + shape_string(b) + " (" +
                                     names_.front() + ", " + other.names_.front() + ")");
        }
    };
    check("prescan", prescan_, other.prescan_);
    check("active", active_, other.active_);
    check("postscan", postscan_, other.postscan_);
    check("original", original_, other.original_);
}

void CalibratedFrame::require_nonzero_divisor(const CalibratedFrame& divisor,
                                              const char* operation) {
    if (has_zero(divisor.prescan_) || has_zero(divisor.active_) ||
        has_zero(divisor.postscan_) || has_zero(divisor.original_)) {
        throw DivisionByZeroError(std::string(operation) + ": " + divisor.names_.front() +
                                  " contains zero-valued samples");
    }
}

void CalibratedFrame::apply(const CalibratedFrame& other, CombineOp op) {
    apply_op(prescan_, other.prescan_, op);
    apply_op(active_, other.active_, op);
    apply_op(postscan_, other.postscan_, op);
    apply_op(original_, other.original_, op);
}

void CalibratedFrame::append_provenance(const CalibratedFrame& other) {
    names_.insert(names_.end(), other.names_.begin(), other.names_.end());
    headers_.insert(headers_.end(), other.headers_.begin(), other.headers_.end());
}

CalibratedFrame CalibratedFrame::combine(const CalibratedFrame& other, CombineOp op) const {
    const std::string operation = "combine " + combine_op_to_string(op);
    require_same_shape(other, operation.c_str());
    if (op == CombineOp::DIVIDE) {
        require_nonzero_divisor(other, operation.c_str());
    }

    CalibratedFrame result = *this;
    result.apply(other, op);
    result.append_provenance(other);
    return result;
}

CalibratedFrame CalibratedFrame::average(const std::vector<CalibratedFrame>& frames) {
    if (frames.empty()) {
        throw EmptyInputError("cannot average an empty frame set");
    }

    CalibratedFrame result = frames.front();
    for (size_t i = 1; i < frames.size(); ++i) {
        result.require_same_shape(frames[i], "average");
        result.apply(frames[i], CombineOp::ADD);
        result.append_provenance(frames[i]);
    }

    const float n = static_cast<float>(frames.size());
    result.prescan_ /= n;
    result.active_ /= n;
    result.postscan_ /= n;
    result.original_ /= n;
    return result;
}

void CalibratedFrame::subtract_bias(const CalibratedFrame& bias) {
    require_same_shape(bias, "subtract_bias");
    apply(bias, CombineOp::SUBTRACT);
    append_provenance(bias);
    bias_corrected_ = true;
}

void CalibratedFrame::divide_flat(const CalibratedFrame& flat) {
    require_same_shape(flat, "divide_flat");
    // Unlike subtract_bias, prescan and postscan are not divided: scan columns see no
    // light, and a bias-subtracted flat has near-zero scans.
    if (has_zero(flat.active_) || has_zero(flat.original_)) {
        throw DivisionByZeroError("divide_flat: " + flat.names_.front() +
                                  " contains zero-valued samples");
    }
    apply_op(active_, flat.active_, CombineOp::DIVIDE);
    apply_op(original_, flat.original_, CombineOp::DIVIDE);
    append_provenance(flat);
    flat_corrected_ = true;
}

float CalibratedFrame::normalize() {
    if (active_.size() == 0) return 0.0f;
    const float mean = static_cast<float>(active_.cast<double>().mean());
    if (mean > 0.0f) {
        active_ /= mean;
        original_ /= mean;
    }
    return mean;
}

void CalibratedFrame::rescale(const image::StretchParams& params) {
    active_ = image::stretch(original_, params);
}

Matrix2Df CalibratedFrame::assemble() const {
    Matrix2Df full(active_.rows(), prescan_.cols() + active_.cols() + postscan_.cols());
    full.leftCols(prescan_.cols()) = prescan_;
    full.middleCols(prescan_.cols(), active_.cols()) = active_;
    full.rightCols(postscan_.cols()) = postscan_;
    return full;
}

const io::HeaderRecord& CalibratedFrame::first_header() const {
    if (headers_.empty()) {
        throw NoHeaderError();
    }
    return headers_.front();
}

std::vector<double> CalibratedFrame::numeric_values(const std::string& key) const {
    if (headers_.empty()) {
        throw NoHeaderError();
    }
    std::vector<double> values;
    values.reserve(headers_.size());
    for (const auto& h : headers_) {
        values.push_back(h.require_double(key));
    }
    return values;
}

std::vector<std::string> CalibratedFrame::string_values(const std::string& key) const {
    if (headers_.empty()) {
        throw NoHeaderError();
    }
    std::vector<std::string> values;
    values.reserve(headers_.size());
    for (const auto& h : headers_) {
        values.push_back(h.require_string(key));
    }
    return values;
}

std::vector<double> CalibratedFrame::airmass() const { return numeric_values("AIRMASS"); }

std::vector<std::string> CalibratedFrame::date() const {
    std::vector<std::string> dates = string_values("DATE-OBS");
    for (auto& d : dates) {
        auto pos = d.find('T');
        if (pos != std::string::npos) {
            d.replace(pos, 1, "  ");
        }
    }
    return dates;
}

std::vector<std::string> CalibratedFrame::dec() const { return string_values("TELDEC"); }
std::vector<double> CalibratedFrame::exp_time() const { return numeric_values("EXPTIME"); }
std::vector<std::string> CalibratedFrame::filter() const { return string_values("FILTERS"); }
std::vector<double> CalibratedFrame::gain() const { return numeric_values("GAIN"); }
std::vector<std::string> CalibratedFrame::hour_angle() const { return string_values("HA"); }
std::vector<double> CalibratedFrame::plate_scale() const { return numeric_values("SCALE"); }
std::vector<std::string> CalibratedFrame::obs_type() const { return string_values("OBSTYPE"); }
std::vector<std::string> CalibratedFrame::ra() const { return string_values("TELRA"); }

int CalibratedFrame::width() const {
    return image::compute_frame_geometry(first_header()).active_width();
}

int CalibratedFrame::height() const {
    return image::compute_frame_geometry(first_header()).height;
}

int CalibratedFrame::prescan_width() const {
    return image::compute_frame_geometry(first_header()).prescan_width;
}

int CalibratedFrame::postscan_width() const {
    return image::compute_frame_geometry(first_header()).postscan_width;
}

std::vector<FrameSummary> CalibratedFrame::summaries() const {
    const auto obs = obs_type();
    const auto filters = filter();
    const auto ras = ra();
    const auto decs = dec();
    const auto dates = date();
    const auto has = hour_angle();
    const auto exps = exp_time();
    const auto airmasses = airmass();
    const auto scales = plate_scale();
    const int w = width();
    const int h = height();

    std::vector<FrameSummary> out;
    out.reserve(headers_.size());
    for (size_t i = 0; i < headers_.size(); ++i) {
        FrameSummary s;
        s.name = names_[i];
        s.obs_type = obs[i];
        s.filter = filters[i];
        s.ra = ras[i];
        s.dec = decs[i];
        s.date = dates[i];
        s.hour_angle = has[i];
        s.exp_time = exps[i];
        s.airmass = airmasses[i];
        s.width = w;
        s.height = h;
        s.plate_scale = scales[i];
        out.push_back(std::move(s));
    }
    return out;
}

std::string CalibratedFrame::summary() const {
    const auto records = summaries();
    const bool indexed = records.size() > 1;

    std::ostringstream oss;
    if (indexed) {
        oss << "This image is the combination of " << records.size() << " images.\n\n";
    }
    for (size_t i = 0; i < records.size(); ++i) {
        const FrameSummary& s = records[i];
        if (indexed) {
            oss << "[" << i << "] ";
        }
        oss << "SUMMARY FOR     " << s.name << "\n"
            << "Obs Type:       " << s.obs_type << "\n"
            << "Filter:         " << s.filter << "\n"
            << "RA/DEC:         " << s.ra << "   " << s.dec << "\n"
            << "UTC Obs Time:   " << s.date << "\n"
            << "Hour Angle:     " << s.hour_angle << "\n"
            << "Exposure Time:  " << s.exp_time << " seconds\n"
            << "Airmass:        " << s.airmass << "\n"
            << "Image Size:     " << s.width << " x " << s.height << "\n"
            << "Plate Scale:    " << s.plate_scale << " arcsec/pix\n\n";
    }
    return oss.str();
}

} // namespace dct_redux::frame
