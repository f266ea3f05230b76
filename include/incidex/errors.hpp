#pragma once
#include <stdexcept>
#include <string>

namespace incidex {

    enum class ErrorKind {
        SourceNotFound,
        UnsupportedFormat,
        StoreConflict,
        StoreFailure,
        NoData,
        InvalidArgument,
        InvalidConfig
    };

    inline const char* to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::SourceNotFound: return "SourceNotFound";
            case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
            case ErrorKind::StoreConflict: return "StoreConflict";
            case ErrorKind::StoreFailure: return "StoreFailure";
            case ErrorKind::NoData: return "NoData";
            case ErrorKind::InvalidArgument: return "InvalidArgument";
            case ErrorKind::InvalidConfig: return "InvalidConfig";
        }
        return "Unknown";
    }

    class Error : public std::runtime_error {
    public:
        Error(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), m_kind(kind) {}

        ErrorKind kind() const noexcept { return m_kind; }

    private:
        ErrorKind m_kind;
    };

    /**
     * @brief Renders a nested exception chain, outermost first, one level per line.
     */
    inline std::string describe_nested(const std::exception& e) {
        std::string out = e.what();
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& inner) {
            out += "\n  caused by: " + describe_nested(inner);
        } catch (...) {
            out += "\n  caused by: unknown exception";
        }
        return out;
    }

    /**
     * @brief Message of the innermost exception in a nested chain.
     */
    inline std::string innermost_what(const std::exception& e) {
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& inner) {
            return innermost_what(inner);
        }
        return e.what();
    }

    /**
     * @brief Kind of the innermost incidex::Error in a nested chain, or fallback.
     */
    inline ErrorKind innermost_kind(const std::exception& e, ErrorKind fallback = ErrorKind::StoreFailure) {
        ErrorKind kind = fallback;
        if (auto* err = dynamic_cast<const Error*>(&e)) kind = err->kind();
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& inner) {
            kind = innermost_kind(inner, kind);
        }
        return kind;
    }

}
