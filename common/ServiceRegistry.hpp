#pragma once

#include <memory>
#include <vector>
#include "Service.hpp"
#include "StopToken.hpp"

namespace fleet_ops::common
{
    class ServiceRegistry
    {
    public:
        void RegisterService(std::shared_ptr<Service> service);

        void StartAll();
        void StopAll();

    private:
        std::vector<std::shared_ptr<Service>> m_services;
        StopToken m_token;
    };
}
