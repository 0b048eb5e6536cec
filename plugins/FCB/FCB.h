#ifndef FCB_H
#define FCB_H

#pragma once

#include <filesystem>

#include "FCBReader.h"
#include "FCBWriter.h"
#include "plugins/CommandRegistry.h"
#include "plugins/PluginBase.h"

namespace FCBForge {

// Binary form plugin: FCB v3 bytes <-> ResourceFile
class FCB : public PluginBase {
public:
  FCB(const std::filesystem::path &resourcePath = "",
      const CodecSettings &settings = CodecSettings());
  ~FCB() override;

  // Core operations
  ResourceFile decode(const std::vector<uint8_t> &bytes) const override;
  std::vector<uint8_t> encode(const ResourceFile &file) const override;

  // Metadata
  std::string getPluginName() const override { return "FCB"; }

  static void registerCommands(CommandTable &commandTable);

private:
  ReaderOptions readerOptions() const;
};

} // namespace FCBForge

#endif // FCB_H
