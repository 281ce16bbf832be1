#ifndef ROOTVISION_REPORTING_HPP
#define ROOTVISION_REPORTING_HPP

#include <exception>
#include <string>

namespace RootVision {

// Print a stage progress message when verbose is set
void printState(bool verbose, const std::string& message);

// Report a failure on stderr, with the exception type when it is known
void printError(const std::exception& error);

} // namespace RootVision

#endif // ROOTVISION_REPORTING_HPP
