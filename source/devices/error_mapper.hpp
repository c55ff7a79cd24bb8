#ifndef SIMDECK_ERROR_MAPPER_HPP
#define SIMDECK_ERROR_MAPPER_HPP

// Per-platform mapping of command executor failures into the shared taxonomy.
// Each adapter routes every failed toolchain call through its platform's mapper,
// adding the operation that was being performed.

#include <string>

#include "command/command_runner.hpp"
#include "devices/device_error.hpp"
#include "devices/device_model.hpp"

namespace devices {

namespace error_mapper {

// Generic mapping:
//   InvalidPath   -> ConfigurationError
//   FailedToStart -> CommandFailed
//   NonZeroExit   -> CommandFailed(operation, stderr), refined per platform
//   TimedOut      -> TimedOut
DeviceError map_failure(DevicePlatform platform,
                        const command_runner::ExecutionFailure &failure,
                        const std::string &operation);

// simctl stderr patterns ("Invalid device", "current state: Booted", ...).
DeviceError map_simulator_failure(const command_runner::ExecutionFailure &failure,
                                  const std::string &operation);

// adb / emulator stderr patterns ("device 'x' not found", "device offline", ...).
DeviceError map_emulator_failure(const command_runner::ExecutionFailure &failure,
                                 const std::string &operation);

} // namespace error_mapper

} // namespace devices

#endif // SIMDECK_ERROR_MAPPER_HPP
