#include "XML.h"

#include "core/Logging/Logging.h"
#include "core/ResourceKind.h"
#include "plugins/CommandRegistry.h"

namespace fs = std::filesystem;

namespace FCBForge {

XML::XML(const fs::path &resourcePath, const CodecSettings &settings)
    : PluginBase(resourcePath, ResourceForm::Markup, settings) {}

XML::~XML() {
  // nothing special
}

ResourceFile XML::decode(const std::vector<uint8_t> &bytes) const {
  MarkupBridge bridge(dictionary());
  std::string text(bytes.begin(), bytes.end());
  return bridge.fromMarkupString(text, getResourceName());
}

std::vector<uint8_t> XML::encode(const ResourceFile &file) const {
  MarkupBridge bridge(dictionary());
  std::string text = bridge.toMarkupString(file);
  return std::vector<uint8_t>(text.begin(), text.end());
}

void XML::registerCommands(CommandTable &commandTable) {
  commandTable["xml"] = {
      "Markup file operations",
      {
          {"tofcb",
           {"Convert markup back to an FCB file (e.g., xml tofcb mapsdata.fcb.converted.xml [out.fcb])",
            [](const std::vector<std::string> &args) -> int {
              if (args.empty()) {
                std::cerr << "Usage: xml tofcb <in.xml> [out.fcb]" << std::endl;
                return 1;
              }
              fs::path output;
              if (args.size() > 1) {
                output = args[1];
              } else {
                std::string binary = ResourceKinds::binaryPathFor(args[0]);
                output = binary.empty() ? fs::path(args[0]).replace_extension(".fcb") : fs::path(binary);
              }
              return PluginManager::getInstance().convertResource(args[0], output) ? 0 : 1;
            }}},
      }};
}

REGISTER_PLUGIN(XML, ResourceForm::Markup);

} // namespace FCBForge
