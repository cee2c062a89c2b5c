#include "regwire/runtime/request.hpp"

#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace shop {

struct get_product {
    int id = 0;
};

struct product {
    int id = 0;
    std::string name;
    double price = 0.0;
};

struct list_products {};

struct place_order {
    int product_id = 0;
    int quantity = 0;
};

class product_repository {
public:
    product_repository() {
        products_[1] = {1, "Keyboard", 49.90};
        products_[2] = {2, "Mouse", 19.50};
    }

    std::optional<product> find(int id) const {
        auto it = products_.find(id);
        if (it == products_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<product> all() const {
        std::vector<product> out;
        for (const auto& [id, p] : products_) {
            out.push_back(p);
        }
        return out;
    }

private:
    std::map<int, product> products_;
};

product_repository& repository() {
    static product_repository repo;
    return repo;
}

class get_product_handler : public regwire::request_handler<get_product, std::optional<product>> {
public:
    std::future<std::optional<product>> handle(const get_product& req,
                                               const regwire::cancel_token&) override {
        std::promise<std::optional<product>> p;
        p.set_value(repository().find(req.id));
        return p.get_future();
    }
};

class list_products_handler : public regwire::request_handler<list_products, std::vector<product>> {
public:
    std::future<std::vector<product>> handle(const list_products&,
                                             const regwire::cancel_token&) override {
        std::promise<std::vector<product>> p;
        p.set_value(repository().all());
        return p.get_future();
    }
};

// Counts orders per scope instance to show scoped lifetime.
class place_order_handler : public regwire::request_handler<place_order, bool> {
public:
    std::future<bool> handle(const place_order& req, const regwire::cancel_token& cancel) override {
        std::promise<bool> p;
        if (cancel.is_cancellation_requested() || !repository().find(req.product_id)) {
            p.set_value(false);
        } else {
            ++orders_;
            p.set_value(req.quantity > 0);
        }
        return p.get_future();
    }

    int orders() const noexcept { return orders_; }

private:
    int orders_ = 0;
};

} // namespace shop

#include "service_registration_extensions.hpp"

// Toy container: scoped services live as long as the scope that created them.
class service_collection {
public:
    template <typename Service, typename Impl> service_collection& add_scoped() {
        factories_[typeid(Service)] = [] {
            return std::static_pointer_cast<void>(std::shared_ptr<Service>(std::make_shared<Impl>()));
        };
        return *this;
    }

    class scope {
    public:
        explicit scope(const service_collection& services) : services_(services) {}

        template <typename Service> std::shared_ptr<Service> get() {
            auto cached = instances_.find(typeid(Service));
            if (cached != instances_.end()) {
                return std::static_pointer_cast<Service>(cached->second);
            }
            auto factory = services_.factories_.find(typeid(Service));
            if (factory == services_.factories_.end()) {
                return nullptr;
            }
            auto instance = factory->second();
            instances_.emplace(typeid(Service), instance);
            return std::static_pointer_cast<Service>(instance);
        }

    private:
        const service_collection& services_;
        std::unordered_map<std::type_index, std::shared_ptr<void>> instances_;
    };

    scope create_scope() const { return scope(*this); }

    size_t size() const noexcept { return factories_.size(); }

private:
    std::unordered_map<std::type_index, std::function<std::shared_ptr<void>()>> factories_;
};

int main() {
    service_collection services;
    regwire::generated::register_handlers(services);
    std::cout << "[registration] " << services.size() << " handlers registered\n";

    regwire::cancel_token cancel;
    {
        auto scope = services.create_scope();
        auto lookup = scope.get<regwire::request_handler<shop::get_product, std::optional<shop::product>>>();
        auto found = lookup->handle(shop::get_product{2}, cancel).get();
        std::cout << "[request] get_product(2) -> " << (found ? found->name : std::string("<none>"))
                  << "\n";

        auto listing = scope.get<regwire::request_handler<shop::list_products, std::vector<shop::product>>>();
        for (const auto& p : listing->handle(shop::list_products{}, cancel).get()) {
            std::cout << "[request] list_products -> " << p.id << " " << p.name << " " << p.price << "\n";
        }

        auto first = scope.get<regwire::request_handler<shop::place_order, bool>>();
        auto second = scope.get<regwire::request_handler<shop::place_order, bool>>();
        first->handle(shop::place_order{1, 2}, cancel).get();
        second->handle(shop::place_order{2, 1}, cancel).get();
        auto* orders = static_cast<shop::place_order_handler*>(second.get());
        std::cout << "[scope] same instance within scope: " << (first == second ? "yes" : "no")
                  << ", orders=" << orders->orders() << "\n";
    }
    {
        auto scope = services.create_scope();
        auto fresh = scope.get<regwire::request_handler<shop::place_order, bool>>();
        auto* orders = static_cast<shop::place_order_handler*>(fresh.get());
        std::cout << "[scope] new scope starts with orders=" << orders->orders() << "\n";
    }

    cancel.request_cancel();
    auto scope = services.create_scope();
    auto order = scope.get<regwire::request_handler<shop::place_order, bool>>();
    std::cout << "[request] place_order after cancel -> "
              << (order->handle(shop::place_order{1, 1}, cancel).get() ? "accepted" : "rejected") << "\n";
    return 0;
}
