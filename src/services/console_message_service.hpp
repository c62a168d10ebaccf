#pragma once

#include <iostream>
#include <string>

#include "services/services.hpp"

namespace gistools::services {

class ConsoleMessageService : public MessageService {
public:
    explicit ConsoleMessageService(std::ostream& out = std::cout)
        : out_(out) {}

    void Info(const std::string& text) override {
        out_ << text << std::endl;
    }

private:
    std::ostream& out_;
};

}  // namespace gistools::services
