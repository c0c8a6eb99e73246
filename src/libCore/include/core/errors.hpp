#pragma once

#include <stdexcept>

namespace minigam {

//! An illegal action was requested. Raised before any state is touched, safe to report to the user.
class ValidationError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

//! Internal inconsistency (unknown move kind, malformed snapshot, broken die source). Not recoverable.
class InvariantError : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

} // namespace minigam
