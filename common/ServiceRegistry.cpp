#include "ServiceRegistry.hpp"
#include <iostream>

namespace fleet_ops::common
{
    void ServiceRegistry::RegisterService(std::shared_ptr<Service> service)
    {
        if (!service)
            return;
        m_services.push_back(std::move(service));
    }

    void ServiceRegistry::StartAll()
    {
        for (const auto &service : m_services)
        {
            std::cout << "[Registry] Starting " << service->Name() << "\n";
            service->Start(m_token);
        }
    }

    // Signals every loop first so they wind down in parallel, then joins them
    // in reverse start order.
    void ServiceRegistry::StopAll()
    {
        m_token.RequestStop();

        for (auto it = m_services.rbegin(); it != m_services.rend(); ++it)
        {
            (*it)->Stop();
            std::cout << "[Registry] Stopped " << (*it)->Name() << "\n";
        }
    }
}
