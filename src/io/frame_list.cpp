#include "dct_redux/io/frame_list.hpp"
#include "dct_redux/core/errors.hpp"
#include "dct_redux/core/utils.hpp"
#include "dct_redux/io/fits_io.hpp"

namespace dct_redux::io {

namespace {

std::string with_fits_extension(const std::string& name) {
    if (is_fits_image_path(fs::path(name))) {
        return name;
    }
    return name + ".fits";
}

std::string strip_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != ' ' && c != '\t') out += c;
    }
    return out;
}

} // namespace

std::vector<fs::path> expand_frame_list(const fs::path& directory, const std::string& pattern) {
    std::vector<fs::path> files;
    const std::string list = core::trim(pattern);
    if (list.empty()) {
        return files;
    }

    if (list.find('*') != std::string::npos || list.find('?') != std::string::npos) {
        fs::path rel(list);
        fs::path dir = directory / rel.parent_path();
        std::string name_pattern = with_fits_extension(rel.filename().string());
        return core::discover_frames(dir, name_pattern);
    }

    const auto open = list.find('[');
    const auto close = list.find(']');
    if (open != std::string::npos && close != std::string::npos) {
        if (close < open) {
            throw ValidationError("malformed frame list: " + list);
        }
        const std::string prefix = list.substr(0, open);
        const std::string suffix = list.substr(close + 1);
        for (const auto& alt : core::split(strip_spaces(list.substr(open + 1, close - open - 1)), ',')) {
            if (alt.empty()) continue;
            files.push_back(directory / with_fits_extension(prefix + alt + suffix));
        }
        return files;
    }

    for (const auto& part : core::split(strip_spaces(list), ',')) {
        if (part.empty()) continue;
        files.push_back(directory / with_fits_extension(part));
    }
    return files;
}

} // namespace dct_redux::io
