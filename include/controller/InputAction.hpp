#pragma once

namespace letterfall::controller {

// What the player asked for, independent of the device that produced it.
// Soft drop is held: one action on press, one on release.
enum class InputAction {
    MoveLeft,
    MoveRight,
    Rotate,
    SoftDropPressed,
    SoftDropReleased,
    HardDrop,
    Hold,
    PauseResume
};

} // namespace letterfall::controller
