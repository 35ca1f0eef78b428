#pragma once

// ============================================================
// errors.hpp -- Error taxonomy shared by client and server
//
//   FtpError
//   |- MalformedLength     size field is not 10 decimal digits
//   |- PayloadTooLarge     frame would exceed 9,999,999,999 bytes
//   |- ConnectionClosed    peer went away (or timed out) mid-frame
//   |- ConnectionRefused   could not reach the peer
//   |- NegotiationTimeout  data connection never arrived
//   |- UnknownCommand      invalid verb or argument count
//   |- ServerError         server answered "error: ..." (client side)
//   '- FileIoError         storage failure
//      |- FileNotFound
//      |- PermissionDenied
//      '- InvalidFileName  name escapes the working directory
// ============================================================

#include <stdexcept>
#include <string>

class FtpError : public std::runtime_error {
public:
    explicit FtpError(const std::string& msg) : std::runtime_error(msg) {}
};

class MalformedLength : public FtpError {
public:
    explicit MalformedLength(const std::string& msg) : FtpError(msg) {}
};

class PayloadTooLarge : public FtpError {
public:
    explicit PayloadTooLarge(const std::string& msg) : FtpError(msg) {}
};

class ConnectionClosed : public FtpError {
public:
    explicit ConnectionClosed(const std::string& msg) : FtpError(msg) {}
};

class ConnectionRefused : public FtpError {
public:
    explicit ConnectionRefused(const std::string& msg) : FtpError(msg) {}
};

class NegotiationTimeout : public FtpError {
public:
    explicit NegotiationTimeout(const std::string& msg) : FtpError(msg) {}
};

class UnknownCommand : public FtpError {
public:
    explicit UnknownCommand(const std::string& msg) : FtpError(msg) {}
};

class ServerError : public FtpError {
public:
    explicit ServerError(const std::string& msg) : FtpError(msg) {}
};

class FileIoError : public FtpError {
public:
    explicit FileIoError(const std::string& msg) : FtpError(msg) {}
};

class FileNotFound : public FileIoError {
public:
    explicit FileNotFound(const std::string& msg) : FileIoError(msg) {}
};

class PermissionDenied : public FileIoError {
public:
    explicit PermissionDenied(const std::string& msg) : FileIoError(msg) {}
};

class InvalidFileName : public FileIoError {
public:
    explicit InvalidFileName(const std::string& msg) : FileIoError(msg) {}
};
