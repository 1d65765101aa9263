#pragma once
#include <functional>
#include <string>
#include "kernel/kernel_spec.hpp"

namespace jotter::tab {

class KernelTab;

// Yes/no prompt; on_confirm runs only if the user accepts
class ConfirmDialog {
public:
    virtual ~ConfirmDialog() = default;
    virtual void show(const std::string& message, std::function<void()> on_confirm) = 0;
};

// One-line notice
class NoticeSurface {
public:
    virtual ~NoticeSurface() = default;
    virtual void show(const std::string& message) = 0;
};

// Lets the user pick a kernel for tab
class KernelSelector {
public:
    virtual ~KernelSelector() = default;
    virtual void show(KernelTab& tab, const std::string& message, const kernel::SpecMap& specs) = 0;
};

// UI surfaces a tab may use. Any may be absent.
struct TabServices {
    ConfirmDialog* confirm = nullptr;
    NoticeSurface* notice = nullptr;
    KernelSelector* selector = nullptr;
};

} // namespace jotter::tab
