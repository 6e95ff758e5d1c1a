#pragma once
///@file

#include <exception>

namespace debstrap {

/**
 * Thrown to leave the program early with `status`, without reporting an
 * error.
 */
class Exit : public std::exception
{
public:
    int status;
    explicit Exit(int status = 0) : status(status) { }
};

}
