#pragma once
#include <stdexcept>
#include <string>

namespace wiz_scan {

// Root of every error raised by wiz-scan components.
class WizError : public std::runtime_error {
public:
    explicit WizError(const std::string& what) : std::runtime_error(what) {}
};

// Protocol client failures
class TimeoutError : public WizError { public: using WizError::WizError; };
class ProtocolError : public WizError { public: using WizError::WizError; };
class NetworkError : public WizError { public: using WizError::WizError; };
class FatalError : public WizError { public: using WizError::WizError; };

// Setup / validation failures raised before any network activity
class InvalidAddressError : public WizError { public: using WizError::WizError; };
class InvalidCidrError : public WizError { public: using WizError::WizError; };
class SubnetTooLargeError : public WizError { public: using WizError::WizError; };
class ScanInProgressError : public WizError {
public:
    ScanInProgressError() : WizError("Scan already in progress") {}
};

// Persistence collaborator failures
class StoreError : public WizError { public: using WizError::WizError; };

}
