#pragma once

#include <QString>

// Error kinds surfaced by the core.
//
// - Validation : a required field is empty or malformed; the user corrects input
// - Format     : malformed hostname or unparseable stored integer
// - NotFound   : a required external binary is absent
// - Unreachable: DNS failure or connection refused during the port probe
// - Timeout    : the port probe did not complete in time
// - Io         : the preferences file (or a spawned process) could not be written/started
//
// None of these are fatal to the process.
enum class ErrorKind {
    None,
    Validation,
    Format,
    NotFound,
    Unreachable,
    Timeout,
    Io
};

static inline QString errorKindToString(ErrorKind k)
{
    switch (k) {
        case ErrorKind::None:        return "none";
        case ErrorKind::Validation:  return "validation";
        case ErrorKind::Format:      return "format";
        case ErrorKind::NotFound:    return "not-found";
        case ErrorKind::Unreachable: return "unreachable";
        case ErrorKind::Timeout:     return "timeout";
        case ErrorKind::Io:          return "io";
    }
    return "none";
}

// Which user input a Validation/Format error refers to, so callers can react
// without parsing the message.
enum class ErrorField {
    None,
    Hostname,
    Port,
    SessionName
};

// Out-parameter carried alongside a bool return, like the QString* err
// convention used throughout. Callers may pass nullptr.
struct Error {
    ErrorKind  kind = ErrorKind::None;
    QString    message;
    ErrorField field = ErrorField::None;

    bool isSet() const { return kind != ErrorKind::None; }

    void clear()
    {
        kind = ErrorKind::None;
        message.clear();
        field = ErrorField::None;
    }
};

static inline void setError(Error *err, ErrorKind kind, const QString &message,
                            ErrorField field = ErrorField::None)
{
    if (!err) return;
    err->kind = kind;
    err->message = message;
    err->field = field;
}

static inline void clearError(Error *err)
{
    if (err) err->clear();
}
