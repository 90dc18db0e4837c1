#pragma once
#include <stdexcept>
#include <string>

// Builder input is geometrically inconsistent; the build must not continue.
class DataIntegrityError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A lookup against the index store failed; the connection is considered lost.
class IndexStoreError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The index store could not be reopened. Not handled anywhere: ends the process.
class IndexStoreFatalError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class UpstreamFetchError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
