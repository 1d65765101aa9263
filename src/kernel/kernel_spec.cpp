#include "kernel/kernel_spec.hpp"

namespace jotter::kernel {

const char* interrupt_mode_to_string(InterruptMode mode) {
    switch (mode) {
        case InterruptMode::SIGNAL: return "signal";
        case InterruptMode::MESSAGE: return "message";
        default: return "signal";
    }
}

InterruptMode interrupt_mode_from_string(const std::string& str) {
    if (str == "message") return InterruptMode::MESSAGE;
    return InterruptMode::SIGNAL;
}

void to_json(nlohmann::json& j, const KernelSpec& spec) {
    j = nlohmann::json{
        {"name", spec.name},
        {"display_name", spec.display_name},
        {"language", spec.language},
        {"argv", spec.argv},
        {"interrupt_mode", interrupt_mode_to_string(spec.interrupt_mode)}
    };
}

void from_json(const nlohmann::json& j, KernelSpec& spec) {
    spec.name = j.value("name", "");
    spec.display_name = j.value("display_name", spec.name);
    spec.language = j.value("language", "");
    spec.argv = j.value("argv", std::vector<std::string>{});
    spec.interrupt_mode = interrupt_mode_from_string(j.value("interrupt_mode", "signal"));
}

StaticSpecSource::StaticSpecSource(const std::vector<KernelSpec>& specs) {
    for (const auto& spec : specs) {
        add(spec);
    }
}

void StaticSpecSource::add(KernelSpec spec) {
    std::string name = spec.name;
    specs_[name] = std::move(spec);
}

} // namespace jotter::kernel
