#include "filepipe/config.hpp"

#include <cerrno>
#include <cstdint>
#include <fstream>

namespace filepipe::config {

namespace {

Result TypeError(const char* key, const char* want) {
    return Result::Fail(EINVAL, std::string("config: \"") + key + "\" must be " + want);
}

Result GetI64IfPresent(const nlohmann::json& j, const char* key, std::int64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_number_integer())
        return TypeError(key, "an integer");
    out = it->get<std::int64_t>();
    return Result::Ok();
}

Result GetIntIfPresent(const nlohmann::json& j, const char* key, int& out) {
    std::int64_t v = out;
    auto r = GetI64IfPresent(j, key, v);
    if (!r.ok)
        return r;
    if (v < INT32_MIN || v > INT32_MAX)
        return Result::Fail(EINVAL, std::string("config: \"") + key + "\" is out of range");
    out = static_cast<int>(v);
    return Result::Ok();
}

Result GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_boolean())
        return TypeError(key, "a boolean");
    out = it->get<bool>();
    return Result::Ok();
}

Result GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_string())
        return TypeError(key, "a string");
    out = it->get<std::string>();
    return Result::Ok();
}

Result LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out) {
    std::ifstream is(path);
    if (!is.good())
        return Result::Fail(ENOENT, "config: cannot open " + path);

    try {
        is >> out;
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(EINVAL, "config: invalid JSON in " + path + ": " + e.what());
    }

    if (!out.is_object())
        return Result::Fail(EINVAL, "config: root must be JSON object: " + path);
    return Result::Ok();
}

} // namespace

Result ReadOptionsFromJson(const nlohmann::json& j, ReadOptions& opts) {
    if (!j.is_object())
        return Result::Fail(EINVAL, "config: read options must be a JSON object");
    ReadOptions o = opts;
    for (auto r : {GetI64IfPresent(j, "offset", o.offset), GetI64IfPresent(j, "limit", o.limit),
                   GetBoolIfPresent(j, "raw", o.raw), GetIntIfPresent(j, "buf_size", o.buf_size)}) {
        if (!r.ok)
            return r;
    }
    opts = std::move(o);
    return Result::Ok();
}

Result WriteOptionsFromJson(const nlohmann::json& j, WriteOptions& opts) {
    if (!j.is_object())
        return Result::Fail(EINVAL, "config: write options must be a JSON object");
    WriteOptions o = opts;
    for (auto r : {GetBoolIfPresent(j, "raw", o.raw), GetIntIfPresent(j, "buf_size", o.buf_size),
                   GetIntIfPresent(j, "deflate_level", o.deflate_level),
                   GetI64IfPresent(j, "zip_offset", o.zip_offset),
                   GetStringIfPresent(j, "zip_comment", o.zip_comment)}) {
        if (!r.ok)
            return r;
    }
    auto r = ValidateWriteOptions(o);
    if (!r.ok)
        return r.Wrap("config");
    opts = std::move(o);
    return Result::Ok();
}

Result LoadOptionsFile(const std::string& path, ReadOptions* read, WriteOptions* write) {
    nlohmann::json j;
    auto r = LoadJsonObjectFromFile(path, j);
    if (!r.ok)
        return r;

    if (read) {
        auto it = j.find("read");
        if (it != j.end()) {
            r = ReadOptionsFromJson(*it, *read);
            if (!r.ok)
                return r.Wrap(path);
        }
    }
    if (write) {
        auto it = j.find("write");
        if (it != j.end()) {
            r = WriteOptionsFromJson(*it, *write);
            if (!r.ok)
                return r.Wrap(path);
        }
    }
    return Result::Ok();
}

} // namespace filepipe::config
