#pragma once

namespace httplib {
class Server;
}  // namespace httplib

namespace mcpgw {

class ServiceManager;

// /proxy/backends for supervised backends and /proxy/register, /proxy/unregister, /proxy/mapping for
// servers started elsewhere. Must be registered before the router's catch-all routes.
void RegisterManagementRoutes(httplib::Server* server, ServiceManager* manager);

}  // namespace mcpgw
