///\file errors.h
///Exception types used to report invalid arguments to axes and histograms

#ifndef GRIDHIST_ERRORS_H
#define GRIDHIST_ERRORS_H

#include <stdexcept>
#include <string>

namespace grid_hist{
	
	///\brief Thrown when an argument has the right kind but an unusable value.
	///
	///Examples are bin edges which are not strictly increasing, histograms whose axes
	///do not match, and unrecognized snapping modes.
	class validationError : public std::invalid_argument{
	public:
		explicit validationError(const std::string& what):std::invalid_argument(what){}
	};
	
	///\brief Thrown when an argument is of the wrong kind for the requested operation,
	///or when an operation would silently discard information held by integer storage.
	class typeError : public std::logic_error{
	public:
		explicit typeError(const std::string& what):std::logic_error(what){}
	};
	
} //namespace grid_hist

#endif //GRIDHIST_ERRORS_H
