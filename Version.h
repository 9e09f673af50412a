#pragma once

// Single source of truth for the VoxLink version.
// Reported by voxlink_peer at startup and in the status JSON.
#define VOXLINK_VERSION_MAJOR  0
#define VOXLINK_VERSION_MINOR  4
#define VOXLINK_VERSION_PATCH  0
#define VOXLINK_VERSION_STRING "0.4.0"
