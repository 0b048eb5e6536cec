#include "ServiceBase.h"
#include "ServiceManager.h"

namespace FCBForge {

bool ServiceBase::registerServiceFactory(const std::string& serviceName,
                                        std::function<std::unique_ptr<ServiceBase>()> factory) {
    return ServiceManager::registerService(serviceName, factory);
}

CommandTable& ServiceBase::getCommandRegistry() {
    static CommandTable commandRegistry;
    return commandRegistry;
}

} // namespace FCBForge
