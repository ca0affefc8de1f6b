//
// Created by cv2 on 14.01.2026.
//

#pragma once
#include <string>
#include <string_view>
#include <expected>

namespace gridlite {

    enum class ErrorCode {
        NoFile,          // No FileRecord for the requested id
        CorruptGridFile, // Missing, truncated or extra chunk
        FileExists,      // Duplicate file id or (files_id, n) pair
        InvalidArgument, // Bad seek target, bad field, write after close
        IOError          // Store failure or failing data source
    };

    struct Error {
        ErrorCode code;
        std::string message;
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    inline std::string_view to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::NoFile:          return "NoFile";
            case ErrorCode::CorruptGridFile: return "CorruptGridFile";
            case ErrorCode::FileExists:      return "FileExists";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::IOError:         return "IOError";
        }
        return "Unknown";
    }

    inline std::unexpected<Error> fail(ErrorCode code, std::string message) {
        return std::unexpected(Error{code, std::move(message)});
    }

} // namespace gridlite
