#ifndef XML_H
#define XML_H

#pragma once

#include <filesystem>

#include "MarkupBridge.h"
#include "plugins/CommandRegistry.h"
#include "plugins/PluginBase.h"

namespace FCBForge {

// Markup form plugin: FCBFile XML documents <-> ResourceFile
class XML : public PluginBase {
public:
  XML(const std::filesystem::path &resourcePath = "",
      const CodecSettings &settings = CodecSettings());
  ~XML() override;

  // Core operations
  ResourceFile decode(const std::vector<uint8_t> &bytes) const override;
  std::vector<uint8_t> encode(const ResourceFile &file) const override;

  // Metadata
  std::string getPluginName() const override { return "XML"; }

  static void registerCommands(CommandTable &commandTable);
};

} // namespace FCBForge

#endif // XML_H
