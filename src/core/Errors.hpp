#pragma once
#include <stdexcept>
#include <string>

// Base of every failure the core reports to its callers.
class LircbraryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Registration/join timeout, connect failure, retry exhaustion, lost link.
class ConnectionError : public LircbraryError {
public:
    using LircbraryError::LircbraryError;
};

// Malformed offer, empty or missing artifact, empty archive.
class ProtocolError : public LircbraryError {
public:
    using LircbraryError::LircbraryError;
};

// Disallowed sender or size ceiling exceeded. Raised before any socket opens.
class PolicyError : public LircbraryError {
public:
    using LircbraryError::LircbraryError;
};

// Transfer socket failure, early EOF, stall, or no offer before the deadline.
class TransferError : public LircbraryError {
public:
    using LircbraryError::LircbraryError;
};

// Archive entry resolving outside its extraction directory.
class ExtractionError : public LircbraryError {
public:
    using LircbraryError::LircbraryError;
};

// Persistent session not connected, timed out, or stopped.
class SessionError : public LircbraryError {
public:
    using LircbraryError::LircbraryError;
};

// Artifact that is not a readable archive of a supported kind.
class ArchiveFormatError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Unreadable ZIP container.
class ZipFormatError : public ArchiveFormatError {
public:
    using ArchiveFormatError::ArchiveFormatError;
};

// Unreadable tar stream, gzip-compressed or plain.
class TarFormatError : public ArchiveFormatError {
public:
    using ArchiveFormatError::ArchiveFormatError;
};
