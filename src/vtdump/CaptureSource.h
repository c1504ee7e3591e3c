// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vtdump/Config.h>

#include <crispy/logstore.h>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>

namespace vtdump
{

/// Raised when the captured bytes cannot be read.
class InputError: public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

inline auto captureLog = logstore::category("vtdump.capture", "Logs capture source selection and reads.");

/// Where the bytes to report on come from.
class CaptureSource
{
  public:
    virtual ~CaptureSource() = default;

    /// Reads the captured bytes.
    ///
    /// @throws InputError if reading fails.
    [[nodiscard]] virtual std::string read() = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

/// Reads everything from an input stream, usually standard input.
class StreamSource final: public CaptureSource
{
  public:
    explicit StreamSource(std::istream& input): _input { input } {}

    [[nodiscard]] std::string read() override;
    [[nodiscard]] std::string describe() const override { return "standard input"; }

  private:
    std::istream& _input;
};

/// Reads a whole file.
class FileSource final: public CaptureSource
{
  public:
    explicit FileSource(std::filesystem::path path): _path { std::move(path) } {}

    [[nodiscard]] std::string read() override;
    [[nodiscard]] std::string describe() const override;

  private:
    std::filesystem::path _path;
};

/// Reads the last bytes of a capture target, a file a terminal session's output is appended to.
class CaptureTailSource final: public CaptureSource
{
  public:
    CaptureTailSource(std::filesystem::path target, size_t size): _target { std::move(target) }, _size { size } {}

    [[nodiscard]] std::string read() override;
    [[nodiscard]] std::string describe() const override;

  private:
    std::filesystem::path _target;
    size_t _size;
};

/// Selects the capture source: --stdin first, then --input, then the capture target.
///
/// @throws ConfigError if the capture target is selected but no target is given
///                     or the size is not positive.
std::unique_ptr<CaptureSource> createCaptureSource(Config const& config, std::istream& standardInput);

} // namespace vtdump
