#ifndef __ERRORS
#define __ERRORS

#include <stdexcept>
#include <string>

// A file or directory the pipeline needs is absent or unreadable.
class MissingResource : public std::runtime_error {
public:
    explicit MissingResource(const std::string &what)
            : std::runtime_error(what) {}
};

class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string &what)
            : std::invalid_argument(what) {}
};

class IndexOutOfRange : public std::out_of_range {
public:
    explicit IndexOutOfRange(const std::string &what)
            : std::out_of_range(what) {}
};

#endif
