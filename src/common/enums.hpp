#pragma once

namespace inventory {

enum class PlatformFamily {
    Linux,
    FreeBSD,
    Unknown
};

enum class SectionKind {
    OS,
    Hardware,
    CPU,
    Memory,
    Storage,
    GPU,
    Network
};

// Priority order matters: detection walks this list top to bottom.
enum class PackageManager {
    Apt,
    AptGet,
    Dnf,
    Yum,
    Pacman,
    Zypper,
    Pkg,
    None
};

enum class InstallAction {
    Install,
    Skip
};

enum class Elevation {
    None,
    Sudo,
    Doas
};

} // namespace inventory
