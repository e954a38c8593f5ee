#include "dct_redux/io/fits_io.hpp"
#include "dct_redux/core/errors.hpp"
#include "dct_redux/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace dct_redux::io {

namespace {

// Written by fits_create_img; never copied from a HeaderRecord.
const std::set<std::string>& structural_keys() {
    static const std::set<std::string> keys = {
        "SIMPLE", "BITPIX", "NAXIS", "NAXIS1", "NAXIS2", "NAXIS3", "EXTEND",
        "BZERO", "BSCALE", "END"
    };
    return keys;
}

std::string format_number(double v) {
    std::ostringstream oss;
    oss.precision(10);
    oss << v;
    return oss.str();
}

} // namespace

void HeaderRecord::touch(const std::string& key) {
    if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
        keys.push_back(key);
    }
    string_values.erase(key);
    numeric_values.erase(key);
    int_values.erase(key);
    bool_values.erase(key);
}

bool HeaderRecord::contains(const std::string& key) const {
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

std::optional<std::string> HeaderRecord::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> HeaderRecord::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto iit = int_values.find(key);
    if (iit != int_values.end()) {
        return static_cast<double>(iit->second);
    }
    return std::nullopt;
}

std::optional<long> HeaderRecord::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    auto dit = numeric_values.find(key);
    if (dit != numeric_values.end() && std::floor(dit->second) == dit->second) {
        return static_cast<long>(dit->second);
    }
    return std::nullopt;
}

std::optional<bool> HeaderRecord::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string HeaderRecord::require_string(const std::string& key) const {
    if (auto s = get_string(key)) return *s;
    if (auto i = int_values.find(key); i != int_values.end()) return std::to_string(i->second);
    if (auto d = numeric_values.find(key); d != numeric_values.end()) return format_number(d->second);
    if (auto b = get_bool(key)) return *b ? "T" : "F";
    throw HeaderError("missing card " + key);
}

double HeaderRecord::require_double(const std::string& key) const {
    if (auto d = get_double(key)) return *d;
    if (auto s = get_string(key)) {
        try {
            return std::stod(*s);
        } catch (const std::exception&) {
            throw HeaderError("card " + key + " is not numeric: '" + *s + "'");
        }
    }
    throw HeaderError("missing numeric card " + key);
}

long HeaderRecord::require_int(const std::string& key) const {
    if (auto i = get_int(key)) return *i;
    if (contains(key)) {
        throw HeaderError("card " + key + " is not an integer");
    }
    throw HeaderError("missing integer card " + key);
}

void HeaderRecord::set(const std::string& key, const std::string& value) {
    touch(key);
    string_values[key] = value;
}

void HeaderRecord::set(const std::string& key, const char* value) {
    set(key, std::string(value));
}

void HeaderRecord::set(const std::string& key, double value) {
    touch(key);
    numeric_values[key] = value;
}

void HeaderRecord::set(const std::string& key, long value) {
    touch(key);
    int_values[key] = value;
}

void HeaderRecord::set(const std::string& key, int value) {
    set(key, static_cast<long>(value));
}

void HeaderRecord::set(const std::string& key, bool value) {
    touch(key);
    bool_values[key] = value;
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::string frame_name_from_path(const fs::path& path) {
    if (is_fits_image_path(path)) {
        return path.stem().string();
    }
    return path.filename().string();
}

RawFrame read_raw_frame(const fs::path& path) {
    if (!fs::exists(path)) {
        throw FileNotFoundError(path.string());
    }

    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw UnsupportedFormatError("cannot open as FITS: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw UnsupportedFormatError("cannot read image parameters: " + path.string());
    }

    if (naxis != 2) {
        fits_close_file(fptr, &status);
        throw UnsupportedFormatError("expected a 2D image, got NAXIS=" +
                                     std::to_string(naxis) + ": " + path.string());
    }

    long width = naxes[0];
    long height = naxes[1];
    long npixels = width * height;

    std::vector<float> buffer(static_cast<size_t>(npixels));
    long fpixel[2] = {1, 1};

    fits_read_pix(fptr, TFLOAT, fpixel, npixels, nullptr, buffer.data(), nullptr, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    RawFrame frame;
    frame.name = frame_name_from_path(path);
    HeaderRecord& header = frame.header;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }

        char dtype = 'C';
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            // Undefined value cards
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stol(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }

    fits_close_file(fptr, &status);

    frame.data.resize(height, width);
    for (long y = 0; y < height; ++y) {
        for (long x = 0; x < width; ++x) {
            frame.data(y, x) = buffer[static_cast<size_t>(y * width + x)];
        }
    }

    return frame;
}

void write_raw_frame(const fs::path& path, const HeaderRecord& header, const Matrix2Df& data) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& key : header.keys) {
        if (key.size() > 8 || structural_keys().count(key)) {
            continue;
        }
        if (auto s = header.string_values.find(key); s != header.string_values.end()) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(s->second.c_str()), nullptr, &status);
        } else if (auto d = header.numeric_values.find(key); d != header.numeric_values.end()) {
            double val = d->second;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        } else if (auto i = header.int_values.find(key); i != header.int_values.end()) {
            long val = i->second;
            fits_update_key(fptr, TLONG, key.c_str(), &val, nullptr, &status);
        } else if (auto b = header.bool_values.find(key); b != header.bool_values.end()) {
            int val = b->second ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    std::vector<float> buffer(static_cast<size_t>(data.size()));
    for (long y = 0; y < data.rows(); ++y) {
        for (long x = 0; x < data.cols(); ++x) {
            buffer[static_cast<size_t>(y * data.cols() + x)] = data(y, x);
        }
    }

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(data.size()), buffer.data(), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

} // namespace dct_redux::io
