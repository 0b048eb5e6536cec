#include "FCB.h"

#include "core/Logging/Logging.h"
#include "core/ResourceKind.h"
#include "plugins/CommandRegistry.h"

namespace fs = std::filesystem;

namespace FCBForge {

FCB::FCB(const fs::path &resourcePath, const CodecSettings &settings)
    : PluginBase(resourcePath, ResourceForm::Binary, settings) {}

FCB::~FCB() {
  // nothing special
}

ReaderOptions FCB::readerOptions() const {
  ReaderOptions options;
  options.preserveUnknownTags = settings_.preserveUnknownTags;
  return options;
}

ResourceFile FCB::decode(const std::vector<uint8_t> &bytes) const {
  FCBReader reader(dictionary(), readerOptions());
  return reader.parse(bytes, getResourceName());
}

std::vector<uint8_t> FCB::encode(const ResourceFile &file) const {
  FCBWriter writer;
  return writer.serialize(file);
}

void FCB::registerCommands(CommandTable &commandTable) {
  commandTable["fcb"] = {
      "FCB binary file operations",
      {
          {"toxml",
           {"Convert an FCB file to markup (e.g., fcb toxml mapsdata.fcb [out.xml])",
            [](const std::vector<std::string> &args) -> int {
              if (args.empty()) {
                std::cerr << "Usage: fcb toxml <in.fcb> [out.xml]" << std::endl;
                return 1;
              }
              fs::path output = args.size() > 1
                                    ? fs::path(args[1])
                                    : fs::path(ResourceKinds::markupPathFor(args[0]));
              return PluginManager::getInstance().convertResource(args[0], output) ? 0 : 1;
            }}},
          {"verify",
           {"Check that files survive a parse/serialize round trip (e.g., fcb verify a.fcb b.fcb)",
            [](const std::vector<std::string> &args) -> int {
              if (args.empty()) {
                std::cerr << "Usage: fcb verify <in.fcb> [more.fcb...]" << std::endl;
                return 1;
              }
              int failures = 0;
              for (const auto &path : args) {
                if (!PluginManager::getInstance().verifyResource(path)) {
                  ++failures;
                }
              }
              return failures == 0 ? 0 : 1;
            }}},
      }};
}

REGISTER_PLUGIN(FCB, ResourceForm::Binary);

} // namespace FCBForge
