#pragma once

#include "trialbox/concat_tostr.hh"

#include <stdexcept>

#define TRIALBOX_STRINGIFY_IMPL(x) #x
#define TRIALBOX_STRINGIFY(x) TRIALBOX_STRINGIFY_IMPL(x)

#define THROW_AS(exception_type, ...)                       \
    throw exception_type(concat_tostr(                       \
        __VA_ARGS__, " (thrown at " __FILE__ ":" TRIALBOX_STRINGIFY(__LINE__) ")"))

// Throws std::runtime_error with the concatenation of the arguments as the message
#define THROW(...) THROW_AS(std::runtime_error, __VA_ARGS__)
