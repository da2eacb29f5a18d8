#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace shop {

struct Widget {
    std::string sku;
    int         quantity = 0;

    bool operator==(const Widget &) const = default;
};

class Auditor {
  public:
    virtual ~Auditor() = default;

    virtual void record(const std::string &event) = 0;
};

class Inventory : public Auditor {
  public:
    virtual int count(const std::string &sku) const = 0;

    // Quantity and the stored widget, if any.
    virtual std::tuple<int, Widget *> lookup(const std::string &sku) = 0;

    virtual int  restock(const Widget &widget, std::initializer_list<int> bins) = 0;
    virtual bool transfer(Widget *widget, const std::vector<Widget> &batch)    = 0;

    virtual std::pair<std::string, bool> label(std::size_t index) = 0;
    virtual std::optional<Widget>        find(int id)             = 0;
};

class Notifier {
  public:
    virtual ~Notifier() = default;

    virtual void                    notify(const std::string &channel, std::initializer_list<std::string> lines) = 0;
    virtual std::unique_ptr<Widget> take(int id)                                                                   = 0;
    virtual const std::string      &banner(int id) const                                                          = 0;
};

} // namespace shop
