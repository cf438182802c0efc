#pragma once

#include <string>
#include <stdexcept>

namespace tapvault {

class Error : public std::exception {
    const std::string m_details;
public:
    Error() noexcept = default;
    Error(const Error&) = default;
    Error(Error&&) noexcept = default;
    explicit Error(std::string&& details) noexcept : m_details(std::move(details)) {}
    ~Error() override = default;

    const char* what() const noexcept override  = 0;
    virtual const char* details() const noexcept { return m_details.c_str(); }
};

// Malformed or inconsistent caller input: rejected before any hashing or signing
class InputError : public Error {
public:
    InputError() noexcept = default;
    explicit InputError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~InputError() override = default;

    const char* what() const noexcept override
    { return "InputError"; }
};

class IllegalArgumentError : public InputError {
public:
    explicit IllegalArgumentError(std::string&& details) noexcept : InputError(std::move(details)) {}
    ~IllegalArgumentError() override = default;

    const char* what() const noexcept override
    { return "IllegalArgumentError"; }
};

class KeyError : public InputError {
public:
    KeyError() noexcept = default;
    explicit KeyError(std::string&& details) noexcept : InputError(std::move(details)) {}
    ~KeyError() override = default;

    const char* what() const noexcept override
    { return "KeyError"; }
};

class WrongKeyError : public KeyError {
public:
    WrongKeyError() noexcept = default;
    explicit WrongKeyError(std::string&& details) noexcept : KeyError(std::move(details)) {}
    ~WrongKeyError() override = default;

    const char* what() const noexcept override
    { return "WrongKeyError"; }
};

class TransactionError : public InputError {
public:
    explicit TransactionError(std::string&& details) noexcept : InputError(std::move(details)) {}
    ~TransactionError() override = default;

    const char* what() const noexcept override
    { return "TransactionError"; }
};

// Well-formed input which does not satisfy the spending conditions (yet)
class PreconditionError : public Error {
public:
    explicit PreconditionError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~PreconditionError() override = default;

    const char* what() const noexcept override
    { return "PreconditionError"; }
};

// Failure reported by the EC engine on valid input. Never retried.
class CryptoError : public Error {
public:
    explicit CryptoError(std::string&& details) noexcept : Error(std::move(details)) {}
    ~CryptoError() override = default;

    const char* what() const noexcept override
    { return "CryptoError"; }
};

class TweakError : public CryptoError {
public:
    explicit TweakError(std::string&& details) noexcept : CryptoError(std::move(details)) {}
    ~TweakError() override = default;

    const char* what() const noexcept override
    { return "InvalidTweak"; }
};

class SignatureError : public CryptoError {
public:
    explicit SignatureError(std::string&& details) noexcept : CryptoError(std::move(details)) {}
    ~SignatureError() override = default;

    const char* what() const noexcept override
    { return "SignatureError"; }
};

template <typename STREAM>
void print_error(const Error& e, STREAM& out, size_t level = 0);

template <typename STREAM>
void print_error(const std::exception& e, STREAM& out, size_t level = 0);

template <typename E, typename STREAM>
void rethrow_nested_to_print(const E& e, STREAM& out, size_t level) {
    try {
        std::rethrow_if_nested(e);
    }
    catch (const Error &nested) {
        print_error(nested, out, level+1);
    }
    catch (const std::exception &nested) {
        print_error(nested, out, level+1);
    }
}

template <typename STREAM>
void print_error(const Error& e, STREAM& out, size_t level) {
    out << std::string(level, ' ') << e.what() << ": " << e.details() << "\n";
    rethrow_nested_to_print(e, out, level);
}

template <typename STREAM>
void print_error(const std::exception& e, STREAM& out, size_t level) {
    out << std::string(level, ' ') << e.what() << "\n";
    rethrow_nested_to_print(e, out, level);
}

template <typename STREAM>
void print_error(STREAM& out) noexcept {
    try {
        std::rethrow_exception(std::current_exception());
    }
    catch(const Error& e) {
        print_error(e, out);
    }
    catch(const std::exception& e) {
        print_error(e, out);
    }
}

}
