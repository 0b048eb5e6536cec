#include "PluginBase.h"

#include <format>
#include <fstream>
#include <system_error>
#include <unistd.h>

#include "core/FCBError.h"
#include "core/Logging/Logging.h"

namespace fs = std::filesystem;

namespace FCBForge {

// Static command registry
CommandTable& PluginBase::getCommandRegistry() {
    static CommandTable commandRegistry;
    return commandRegistry;
}

PluginBase::PluginBase(const fs::path& resourcePath, ResourceForm form, const CodecSettings& settings)
    : resourcePath_(resourcePath), form_(form), settings_(settings) {
    if (!settings_.dictionary) {
        settings_.dictionary = std::make_shared<ClassDictionary>();
    }
}

PluginBase::~PluginBase() = default;

std::string PluginBase::getResourceName() const {
    return resourcePath_.filename().string();
}

ResourceFile PluginBase::load() const {
    std::vector<uint8_t> bytes = readFileBytes(resourcePath_);
    Log(DEBUG, getPluginName().c_str(), "Decoding {} ({} bytes)", resourcePath_.string(), bytes.size());
    ResourceFile file = decode(bytes);
    file.name = getResourceName();
    return file;
}

void PluginBase::save(const ResourceFile& file, bool keepBackup) const {
    std::vector<uint8_t> bytes = encode(file);
    writeFileAtomically(resourcePath_, bytes, keepBackup);
    Log(DEBUG, getPluginName().c_str(), "Wrote {} ({} bytes)", resourcePath_.string(), bytes.size());
}

std::vector<uint8_t> PluginBase::readFileBytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw FCBError(ErrorKind::IOFailure, std::format("cannot open {} for reading", path.string()));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw FCBError(ErrorKind::IOFailure, std::format("error while reading {}", path.string()));
    }
    return bytes;
}

void PluginBase::writeFileAtomically(const fs::path& path, const std::vector<uint8_t>& bytes, bool keepBackup) {
    fs::path tempPath = path;
    tempPath += std::format(".tmp-{}", static_cast<long>(::getpid()));

    auto fail = [&](const std::string& message) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        Log(ERROR, "PluginBase", "Save of {} failed: {}", path.string(), message);
        throw FCBError(ErrorKind::IOFailure, std::format("{}: {}", path.string(), message));
    };

    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            fail(std::format("cannot create temporary file {}", tempPath.string()));
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            fail(std::format("short write to {}", tempPath.string()));
        }
    }

    std::error_code ec;
    if (keepBackup && fs::is_regular_file(path, ec)) {
        fs::path backupPath = path;
        backupPath += ".bak";
        fs::copy_file(path, backupPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            fail(std::format("cannot write backup {}: {}", backupPath.string(), ec.message()));
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        fail(std::format("cannot replace target: {}", ec.message()));
    }
}

void PluginBase::registerPluginFactory(ResourceForm form, PluginFactory factory) {
    PluginManager::getInstance().registerPlugin(form, std::move(factory));
}

} // namespace FCBForge
