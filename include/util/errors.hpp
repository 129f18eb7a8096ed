#pragma once

#include "util/result.hpp"

namespace filepipe {

enum ErrorKind : int {
    kErrGeneric = -1,
    kErrEof = -2,
    kErrUnexpectedEof = -3,
    kErrNotTar = -4,
    kErrNotZip = -5,
    kErrIsDir = -6,
    kErrZipWriteBeforeCreate = -7,
    kErrFileReaderClosed = -8,
    kErrFileWriterClosed = -9,
    kErrBufferFull = -10,
    kErrOutOfRange = -11,
    kErrInsecurePath = -12,
    kErrNotExist = -13,
    kErrInvalidUnread = -14,
    kErrNegativeCount = -15,
    kErrChecksum = -16,
    kErrFormat = -17,
    kErrWriteTooLong = -18,
    kErrReadZip = -19,
    kErrUnsupportedMethod = -20,
    kErrNotRegular = -21,
};

const char* ErrorKindName(int kind);

Result ErrEof();
Result ErrUnexpectedEof();
Result ErrNotTar();
Result ErrNotZip();
Result ErrIsDir();
Result ErrZipWriteBeforeCreate();
Result ErrFileReaderClosed();
Result ErrFileWriterClosed();
Result ErrBufferFull();
Result ErrReadZip();

// Fails with errno, appending strerror(e) to what.
Result ErrnoFail(int e, const std::string& what);

inline bool IsEof(const Result& r) { return r.Is(kErrEof); }

inline bool IsClosedError(const Result& r) {
    return r.Is(kErrFileReaderClosed) || r.Is(kErrFileWriterClosed);
}

} // namespace filepipe
