#include "neural/model_io.hpp"
#include <cstdio>
#include <filesystem>

namespace glyphnet {

Result save_model(const std::string& path, const Model& model) {
    std::string error;
    if (!model.validate(0, error)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "refusing to save invalid model: " + error);
    }

    std::error_code ec;
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return Result::fail(ErrorCode::IO_ERROR, "cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    const std::vector<uint8_t> bytes = model.encode();
    const std::string tmp = path + ".tmp";

    FILE* f = fopen(tmp.c_str(), "wb");
    if (!f) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot open " + tmp + " for writing");
    }
    const bool written = fwrite(bytes.data(), 1, bytes.size(), f) == bytes.size();
    const bool closed = fclose(f) == 0;
    if (!written || !closed) {
        std::filesystem::remove(tmp, ec);
        return Result::fail(ErrorCode::IO_ERROR, "short write to " + tmp);
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return Result::fail(ErrorCode::IO_ERROR, "cannot replace " + path);
    }
    return Result::ok();
}

Result load_model(const std::string& path, Model& out, int feature_count) {
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot open model " + path);
    }

    std::vector<uint8_t> bytes;
    uint8_t buf[64 * 1024];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        bytes.insert(bytes.end(), buf, buf + n);
    }
    const bool failed = ferror(f) != 0;
    fclose(f);
    if (failed) {
        return Result::fail(ErrorCode::IO_ERROR, "read error on " + path);
    }

    Model model;
    Result r = Model::decode(bytes, model);
    if (r.failure()) {
        return Result::fail(r.error, path + ": " + r.message);
    }

    std::string error;
    if (!model.validate(feature_count, error)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, path + ": " + error);
    }
    out = std::move(model);
    return Result::ok();
}

}
