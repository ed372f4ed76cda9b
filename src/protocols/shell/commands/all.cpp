#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/usage/ReframeUsage.hpp"
#include "config/ConfigRegistry.hpp"

namespace rf::protocols::shell {

void registerAllCommands(Router& router) {
    using config::ConfigRegistry;

    router.registerCommand(ReframeUsage::convert(), [](const CommandCall& call) {
        return convert(call, ConfigRegistry::get().encoding);
    });

    router.registerCommand(ReframeUsage::serve(), [](const CommandCall&) {
        return serve(ConfigRegistry::get());
    });

    router.registerCommand(ReframeUsage::help(), help);
    router.registerCommand(ReframeUsage::version(), version);
}

}
