#pragma once

#include "sections/section_collector.hpp"

namespace inventory {

// Hostname, distribution, kernel, uptime, timezone.
class OsSection : public SectionCollector
{
public:
    SectionKind kind() const override { return SectionKind::OS; }
    std::string title() const override { return "Operating System"; }
    std::string collect(const SectionContext &context) const override;
};

// Vendor, model, BIOS, serial and, when recognised, the board model.
class HardwareSection : public SectionCollector
{
public:
    SectionKind kind() const override { return SectionKind::Hardware; }
    std::string title() const override { return "Hardware"; }
    std::string collect(const SectionContext &context) const override;
};

class CpuSection : public SectionCollector
{
public:
    SectionKind kind() const override { return SectionKind::CPU; }
    std::string title() const override { return "CPU"; }
    std::string collect(const SectionContext &context) const override;
};

class MemorySection : public SectionCollector
{
public:
    SectionKind kind() const override { return SectionKind::Memory; }
    std::string title() const override { return "Memory"; }
    std::string collect(const SectionContext &context) const override;
};

class StorageSection : public SectionCollector
{
public:
    SectionKind kind() const override { return SectionKind::Storage; }
    std::string title() const override { return "Storage"; }
    std::string collect(const SectionContext &context) const override;
};

class GpuSection : public SectionCollector
{
public:
    SectionKind kind() const override { return SectionKind::GPU; }
    std::string title() const override { return "Graphics"; }
    std::string collect(const SectionContext &context) const override;
};

class NetworkSection : public SectionCollector
{
public:
    SectionKind kind() const override { return SectionKind::Network; }
    std::string title() const override { return "Network Interfaces"; }
    std::string collect(const SectionContext &context) const override;
};

} // namespace inventory
