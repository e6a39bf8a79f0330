#pragma once
#include <stdexcept>
#include <string>

namespace mrsfit {

/* ------------------------------------------------------------------------- */
/*  Error taxonomy                                                           */
/*                                                                           */
/*  PreconditionError       caller handed us something we cannot work on     */
/*  UnsupportedError        valid request, but not implemented for this      */
/*                          protocol / editing target                        */
/*  DataInconsistencyError  a batch does not fit together (sample counts,    */
/*                          paired lists); raised before any dataset starts  */
/*                                                                           */
/*  Numerical trouble is never thrown: it ends up as a flag or a sentinel.   */
/* ------------------------------------------------------------------------- */
class PreconditionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class UnsupportedError : public PreconditionError {
public:
    explicit UnsupportedError(const std::string& what)
        : PreconditionError("unsupported: " + what) {}
};

class DataInconsistencyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace mrsfit
