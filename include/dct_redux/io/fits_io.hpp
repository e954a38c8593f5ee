#pragma once

#include "dct_redux/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dct_redux::io {

// Ordered header card set of one raw frame. Values are kept in typed maps;
// `keys` records card order.
struct HeaderRecord {
    std::vector<std::string> keys;
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, long> int_values;
    std::map<std::string, bool> bool_values;

    bool contains(const std::string& key) const;
    size_t size() const { return keys.size(); }

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<long> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    // Throw HeaderError when the card is absent or not convertible.
    // require_string formats numeric cards; require_double accepts integer cards.
    std::string require_string(const std::string& key) const;
    double require_double(const std::string& key) const;
    long require_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, double value);
    void set(const std::string& key, long value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);

private:
    void touch(const std::string& key);
};

struct RawFrame {
    std::string name;
    HeaderRecord header;
    Matrix2Df data;  // NAXIS2 rows x NAXIS1 columns
};

bool is_fits_image_path(const fs::path& path);

// File name without its FITS extension
std::string frame_name_from_path(const fs::path& path);

RawFrame read_raw_frame(const fs::path& path);

void write_raw_frame(const fs::path& path, const HeaderRecord& header, const Matrix2Df& data);

} // namespace dct_redux::io
