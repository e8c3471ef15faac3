#pragma once

#include <stdexcept>
#include <string>

// Corrupt, encrypted or zero-page document. Reported per file.
class unreadable_document_error : public std::runtime_error {
    public:
        explicit unreadable_document_error(const std::string& what) : std::runtime_error(what) {}
};

// The document has pages but no extractable text fragment.
class parse_error : public std::runtime_error {
    public:
        explicit parse_error(const std::string& what) : std::runtime_error(what) {}
};

// The per-document wall-clock budget ran out.
class document_timeout_error : public std::runtime_error {
    public:
        explicit document_timeout_error(const std::string& what) : std::runtime_error(what) {}
};

class configuration_error : public std::runtime_error {
    public:
        explicit configuration_error(const std::string& what) : std::runtime_error(what) {}
};

class output_error : public std::runtime_error {
    public:
        explicit output_error(const std::string& what) : std::runtime_error(what) {}
};
