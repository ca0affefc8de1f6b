//
// Created by cv2 on 15.01.2026.
//

#pragma once
#include <string>
#include <string_view>
#include <format>
#include "../common/errors.hpp"
#include "../common/db.hpp"

namespace gridlite {

    inline std::string_view to_string(DbError e) {
        switch (e) {
            case DbError::DuplicateKey: return "duplicate key";
            case DbError::QueryFailed:  return "query failed";
            case DbError::InvalidField: return "invalid field";
            case DbError::NotOpen:      return "database not open";
        }
        return "unknown";
    }

    // Maps a store failure onto the grid error taxonomy
    inline Error store_error(DbError e, std::string_view what) {
        ErrorCode code = ErrorCode::IOError;
        if (e == DbError::DuplicateKey) code = ErrorCode::FileExists;
        else if (e == DbError::InvalidField) code = ErrorCode::InvalidArgument;
        return Error{code, std::format("{}: {}", what, to_string(e))};
    }

} // namespace gridlite
