#include "util/errors.hpp"

#include <cstring>

namespace filepipe {

const char* ErrorKindName(int kind) {
    switch (kind) {
        case kErrGeneric:              return "error";
        case kErrEof:                  return "EOF";
        case kErrUnexpectedEof:        return "unexpected EOF";
        case kErrNotTar:               return "not tar";
        case kErrNotZip:               return "not zip";
        case kErrIsDir:                return "is a directory";
        case kErrZipWriteBeforeCreate: return "zip write before create";
        case kErrFileReaderClosed:     return "file reader closed";
        case kErrFileWriterClosed:     return "file writer closed";
        case kErrBufferFull:           return "buffer full";
        case kErrOutOfRange:           return "out of range";
        case kErrInsecurePath:         return "insecure path";
        case kErrNotExist:             return "not exist";
        case kErrInvalidUnread:        return "invalid unread";
        case kErrNegativeCount:        return "negative count";
        case kErrChecksum:             return "checksum error";
        case kErrFormat:               return "format error";
        case kErrWriteTooLong:         return "write too long";
        case kErrReadZip:              return "read zip";
        case kErrUnsupportedMethod:    return "unsupported method";
        case kErrNotRegular:           return "not a regular file";
        default:                       return kind > 0 ? "system error" : "error";
    }
}

Result ErrEof() { return Result::Fail(kErrEof, "EOF"); }

Result ErrUnexpectedEof() { return Result::Fail(kErrUnexpectedEof, "unexpected EOF"); }

Result ErrNotTar() {
    return Result::Fail(kErrNotTar, "file is not archived by tar, or is opened in raw mode");
}

Result ErrNotZip() {
    return Result::Fail(kErrNotZip, "file is not archived by ZIP, or is opened in raw mode");
}

Result ErrIsDir() { return Result::Fail(kErrIsDir, "file is a directory"); }

Result ErrZipWriteBeforeCreate() {
    return Result::Fail(kErrZipWriteBeforeCreate,
                        "write before creating a new file in the ZIP archive");
}

Result ErrFileReaderClosed() {
    return Result::Fail(kErrFileReaderClosed, "file reader is already closed");
}

Result ErrFileWriterClosed() {
    return Result::Fail(kErrFileWriterClosed, "file writer is already closed");
}

Result ErrReadZip() {
    return Result::Fail(kErrReadZip, "file is archived by ZIP; open its entries instead");
}

Result ErrBufferFull() { return Result::Fail(kErrBufferFull, "buffer full"); }

Result ErrnoFail(int e, const std::string& what) {
    return Result::Fail(e, what + " (" + std::strerror(e) + ")");
}

} // namespace filepipe
