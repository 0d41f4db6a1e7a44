#ifndef TODOKEEP_HTTP_TODOROUTER_HPP
#define TODOKEEP_HTTP_TODOROUTER_HPP

#include "IRouter.hpp"
#include "ITodoListController.hpp"
#include <memory>

class TodoRouter : public IRouter {
public:
    explicit TodoRouter(std::shared_ptr<ITodoListController> controller);

    void registerRoutes(QHttpServer &server) override;

private:
    std::shared_ptr<ITodoListController> m_controller;
};

#endif // TODOKEEP_HTTP_TODOROUTER_HPP
