#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace jotter::kernel {

// How an interrupt is delivered to the kernel
enum class InterruptMode {
    SIGNAL,   // SIGINT to the kernel process
    MESSAGE   // interrupt_request on the control channel
};

const char* interrupt_mode_to_string(InterruptMode mode);
InterruptMode interrupt_mode_from_string(const std::string& str);

// Description of an installed kernel
struct KernelSpec {
    std::string name;
    std::string display_name;
    std::string language;
    std::vector<std::string> argv;   // "{socket}" is replaced by the session socket path
    InterruptMode interrupt_mode = InterruptMode::SIGNAL;
};

void to_json(nlohmann::json& j, const KernelSpec& spec);
void from_json(const nlohmann::json& j, KernelSpec& spec);

using SpecMap = std::map<std::string, KernelSpec>;

// Read-only source of available kernels
class SpecSource {
public:
    virtual ~SpecSource() = default;
    virtual SpecMap list_specs() const = 0;
};

// Specs supplied up front (config file, tests)
class StaticSpecSource final : public SpecSource {
public:
    StaticSpecSource() = default;
    explicit StaticSpecSource(const std::vector<KernelSpec>& specs);

    void add(KernelSpec spec);
    SpecMap list_specs() const override { return specs_; }

private:
    SpecMap specs_;
};

} // namespace jotter::kernel
