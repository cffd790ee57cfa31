// include/Zipkit/Error.hpp
#ifndef ZIPKIT_ERROR_HPP
#define ZIPKIT_ERROR_HPP

#include <string>
#include <utility>

namespace Zipkit {

    enum class ErrorKind {
        None,
        Io,             // filesystem or codec failure
        VisitorAbort,   // a visitor rejected an entry
        SizeMismatch,   // streamed bytes differ from the declared header size
        NotFound,
        InvalidArgument,
        InvalidState
    };

    const char* toString(ErrorKind kind);

    // Result of every archive operation. A default constructed Error means success.
    class Error {
    public:
        Error() = default;
        Error(ErrorKind kind, std::string message) : m_kind(kind), m_message(std::move(message)) {}

        static Error io(std::string message) { return {ErrorKind::Io, std::move(message)}; }
        static Error visitorAbort(std::string message) { return {ErrorKind::VisitorAbort, std::move(message)}; }
        static Error sizeMismatch(std::string message) { return {ErrorKind::SizeMismatch, std::move(message)}; }
        static Error notFound(std::string message) { return {ErrorKind::NotFound, std::move(message)}; }
        static Error invalidArgument(std::string message) { return {ErrorKind::InvalidArgument, std::move(message)}; }
        static Error invalidState(std::string message) { return {ErrorKind::InvalidState, std::move(message)}; }

        bool ok() const { return m_kind == ErrorKind::None; }
        ErrorKind kind() const { return m_kind; }
        const std::string& message() const { return m_message; }

        // "<kind>: <message>", or "ok"
        std::string describe() const;

        bool operator==(const Error& other) const {
            return m_kind == other.m_kind && m_message == other.m_message;
        }
        bool operator!=(const Error& other) const { return !(*this == other); }

    private:
        ErrorKind m_kind = ErrorKind::None;
        std::string m_message;
    };

} // namespace Zipkit

#endif // ZIPKIT_ERROR_HPP
