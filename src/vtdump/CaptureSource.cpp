// SPDX-License-Identifier: Apache-2.0
#include <vtdump/CaptureSource.h>

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace vtdump
{

namespace
{
    std::string readAll(std::istream& input)
    {
        auto buffer = std::ostringstream {};
        buffer << input.rdbuf();
        return buffer.str();
    }

    std::ifstream openBinary(std::filesystem::path const& path)
    {
        auto file = std::ifstream { path, std::ios::binary };
        if (!file.good())
            throw InputError(fmt::format("Cannot open {}. {}", path.string(), std::strerror(errno)));
        return file;
    }
} // namespace

std::string StreamSource::read()
{
    auto data = readAll(_input);
    if (_input.bad())
        throw InputError("Reading standard input failed.");

    captureLog()("Read {} bytes from {}.", data.size(), describe());
    return data;
}

std::string FileSource::describe() const
{
    return fmt::format("file {}", _path.string());
}

std::string FileSource::read()
{
    auto file = openBinary(_path);
    auto data = readAll(file);
    if (file.bad())
        throw InputError(fmt::format("Reading {} failed.", _path.string()));

    captureLog()("Read {} bytes from {}.", data.size(), describe());
    return data;
}

std::string CaptureTailSource::describe() const
{
    return fmt::format("last {} bytes of capture target {}", _size, _target.string());
}

std::string CaptureTailSource::read()
{
    auto file = openBinary(_target);

    auto data = std::string {};
    if (file.seekg(0, std::ios::end); file)
    {
        auto const fileSize = static_cast<size_t>(file.tellg());
        auto const start = fileSize > _size ? fileSize - _size : 0;
        file.seekg(static_cast<std::streamoff>(start), std::ios::beg);
        data.resize(fileSize - start);
        file.read(data.data(), static_cast<std::streamsize>(data.size()));
        data.resize(static_cast<size_t>(file.gcount()));
    }
    else
    {
        // Not seekable (e.g. a FIFO): read everything and keep the tail.
        file.clear();
        data = readAll(file);
        if (data.size() > _size)
            data.erase(0, data.size() - _size);
    }

    if (file.bad())
        throw InputError(fmt::format("Reading capture target {} failed.", _target.string()));

    captureLog()("Read {} bytes from {}.", data.size(), describe());
    return data;
}

std::unique_ptr<CaptureSource> createCaptureSource(Config const& config, std::istream& standardInput)
{
    auto source = [&]() -> std::unique_ptr<CaptureSource> {
        if (config.fromStdin)
            return std::make_unique<StreamSource>(standardInput);

        if (!config.inputFile.empty())
            return std::make_unique<FileSource>(config.inputFile);

        if (config.size <= 0)
            throw ConfigError("size must be greater than 0");

        if (config.target.empty())
            throw ConfigError("No capture target given. Use --target, --input or --stdin.");

        return std::make_unique<CaptureTailSource>(config.target, static_cast<size_t>(config.size));
    }();

    captureLog()("Using {}.", source->describe());
    return source;
}

} // namespace vtdump
