#pragma once

#include <stdexcept>
#include <string>

// Base of every failure the registry reports to the HTTP front.
class LinkError : public std::runtime_error {
public:
    explicit LinkError(const std::string& message) : std::runtime_error(message) {}
};

// Bad input shape or format (400).
class ValidationError : public LinkError {
public:
    explicit ValidationError(const std::string& message) : LinkError(message) {}
};

// Short code already taken (409).
class ConflictError : public LinkError {
public:
    explicit ConflictError(const std::string& message) : LinkError(message) {}
};

// Unknown short code (404).
class NotFoundError : public LinkError {
public:
    explicit NotFoundError(const std::string& message) : LinkError(message) {}
};

// Any datastore failure (500). The message is internal detail and is never sent to clients.
class StoreError : public LinkError {
public:
    explicit StoreError(const std::string& message) : LinkError(message) {}
};
