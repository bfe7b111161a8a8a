#include "../../include/errors.hpp"

namespace quarry {

    std::string_view to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::NoSuchFile:          return "NoSuchFile";
            case ErrorCode::CreateContextFailed: return "CreateContextFailed";
            case ErrorCode::OpenDocumentFailed:  return "OpenDocumentFailed";
            case ErrorCode::OpenMemoryFailed:    return "OpenMemoryFailed";
            case ErrorCode::NeedsPassword:       return "NeedsPassword";
            case ErrorCode::PageMissing:         return "PageMissing";
            case ErrorCode::ObjectMissing:       return "ObjectMissing";
            case ErrorCode::NotImage:            return "NotImage";
            case ErrorCode::LoadOutlineFailed:   return "LoadOutlineFailed";
            case ErrorCode::CreatePixmapFailed:  return "CreatePixmapFailed";
            case ErrorCode::PixmapSamplesFailed: return "PixmapSamplesFailed";
            case ErrorCode::ExtractTextFailed:   return "ExtractTextFailed";
            case ErrorCode::DocumentClosed:      return "DocumentClosed";
        }
        return "Unknown";
    }

} // namespace quarry
