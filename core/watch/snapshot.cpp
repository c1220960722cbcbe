#include "snapshot.hpp"

#include <filesystem>
#include <system_error>

namespace trellico {
namespace watch {

namespace fs = std::filesystem;

namespace {

// Opens dir for iteration. Returns false only on real errors.
bool open_dir(const std::string &dir, fs::directory_iterator &it, bool &missing, std::string &error) {
    std::error_code ec;
    missing = false;

    if (!fs::exists(dir, ec)) {
        if (ec) {
            error = "Failed to stat " + dir + ": " + ec.message();
            return false;
        }
        missing = true;
        return true;
    }

    it = fs::directory_iterator(dir, ec);
    if (ec) {
        error = "Failed to read " + dir + ": " + ec.message();
        return false;
    }
    return true;
}

}  // namespace

bool scan_plan_stems(const std::string &dir, const std::string &extension, StemSet &out, std::string &error) {
    out.clear();

    fs::directory_iterator it;
    bool missing = false;
    if (!open_dir(dir, it, missing, error)) {
        return false;
    }
    if (missing) {
        return true;
    }

    std::error_code ec;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            error = "Failed to read " + dir + ": " + ec.message();
            return false;
        }

        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }

        const fs::path &path = it->path();
        if (path.extension().string() != extension) {
            continue;
        }
        out.insert(path.stem().string());
    }
    if (ec) {
        error = "Failed to read " + dir + ": " + ec.message();
        return false;
    }
    return true;
}

bool scan_prd_entries(const std::string &dir, const std::string &manifest, StemSet &out, std::string &error) {
    out.clear();

    fs::directory_iterator it;
    bool missing = false;
    if (!open_dir(dir, it, missing, error)) {
        return false;
    }
    if (missing) {
        return true;
    }

    std::error_code ec;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            error = "Failed to read " + dir + ": " + ec.message();
            return false;
        }

        std::error_code type_ec;
        if (!it->is_directory(type_ec)) {
            continue;
        }

        std::error_code manifest_ec;
        if (fs::is_regular_file(it->path() / manifest, manifest_ec)) {
            out.insert(it->path().filename().string());
        }
    }
    if (ec) {
        error = "Failed to read " + dir + ": " + ec.message();
        return false;
    }
    return true;
}

}  // namespace watch
}  // namespace trellico
