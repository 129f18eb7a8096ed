#include "filepipe/options.hpp"

#include "archive/zip_format.hpp"
#include "io/deflate_writer.hpp"

#include <cerrno>

namespace filepipe {

Result ValidateWriteOptions(const WriteOptions& opts) {
    if (!ValidDeflateLevel(opts.deflate_level)) {
        return Result::Fail(EINVAL, "deflate_level " + std::to_string(opts.deflate_level) +
                                        " is out of range [-2, 9]");
    }
    if (opts.zip_offset < 0) {
        return Result::Fail(EINVAL, "zip_offset " + std::to_string(opts.zip_offset) + " is negative");
    }
    if (opts.zip_comment.size() > kZipMaxCommentLen) {
        return Result::Fail(EINVAL, "zip_comment is longer than " + std::to_string(kZipMaxCommentLen) +
                                        " bytes");
    }
    return Result::Ok();
}

} // namespace filepipe
