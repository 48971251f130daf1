//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
//=============================================================================//

#ifndef PORTAL_SHAREDDEFS_H
#define PORTAL_SHAREDDEFS_H
#ifdef _WIN32
#pragma once
#endif

#include "tier1/convar.h"
#include "basehandle.h"

// Offset along the surface normal applied to a fresh placement so the portal quad doesn't z-fight the wall
#define PORTAL_Z_FIGHTING_OFFSET 0.001f

// Tolerance used for "is this vector degenerate" checks in the orientation math
#define PORTAL_DEGENERATE_EPSILON 0.001f

enum PortalSlot_t
{
	PORTAL_SLOT_A = 0,
	PORTAL_SLOT_B,

	PORTAL_SLOT_COUNT
};

inline PortalSlot_t PortalSlot_Other( PortalSlot_t slot )
{
	return ( slot == PORTAL_SLOT_A ) ? PORTAL_SLOT_B : PORTAL_SLOT_A;
}

inline const char *PortalSlot_Name( PortalSlot_t slot )
{
	return ( slot == PORTAL_SLOT_A ) ? "A" : "B";
}

enum PortalOrientation_t
{
	PORTAL_ORIENTATION_HORIZONTAL = 0,	// On a floor or ceiling
	PORTAL_ORIENTATION_OTHER,			// Walls, slopes, anything that isn't a floor or ceiling
};

enum PortalFizzleType_t
{
	PORTAL_FIZZLE_SUCCESS = 0,			// Placed fine (no fizzle)
	PORTAL_FIZZLE_BAD_SURFACE,			// Hit something but couldn't build a frame on it
	PORTAL_FIZZLE_NONE,					// Didn't hit anything

	NUM_PORTAL_FIZZLE_TYPES
};

// Collision groups as bits, shared by the filters and the trace masks
enum PortalCollisionGroup_t
{
	PORTAL_COLLISION_WALLS						= (1<<0),
	PORTAL_COLLISION_PROPS						= (1<<1),
	PORTAL_COLLISION_PORTAL						= (1<<2),
	PORTAL_COLLISION_PLAYER						= (1<<3),
	PORTAL_COLLISION_RAYCAST					= (1<<4),
	PORTAL_COLLISION_GROUND						= (1<<5),
	PORTAL_COLLISION_DOOR_SENSORS				= (1<<6),
	PORTAL_COLLISION_LEVEL_TRANSITION_SENSORS	= (1<<7),

	PORTAL_COLLISION_ALL						= 0xFFFFFFFF
};

#define MASK_PORTAL_STATIC_GEOMETRY ( PORTAL_COLLISION_WALLS | PORTAL_COLLISION_GROUND )

enum PortalBodyMotion_t
{
	PORTAL_BODY_DYNAMIC = 0,
	PORTAL_BODY_KINEMATIC,
};

enum PortalTeleportableType_t
{
	PORTAL_TELEPORTABLE_PROP = 0,
	PORTAL_TELEPORTABLE_PLAYER,
};

// An entity allowed to pass through portals
struct PortalTeleportable_t
{
	CBaseHandle					hEntity;
	PortalTeleportableType_t	type;
};

// Collision filter for a teleportable touching a portal with the given orientation. Drops the
// static geometry the portal is cut into while still colliding with everything else.
inline unsigned int PortalRelaxedCollisionMask( PortalOrientation_t orientation )
{
	if ( orientation == PORTAL_ORIENTATION_HORIZONTAL )
		return PORTAL_COLLISION_PLAYER | PORTAL_COLLISION_PROPS | PORTAL_COLLISION_PORTAL | PORTAL_COLLISION_WALLS;

	return PORTAL_COLLISION_PLAYER | PORTAL_COLLISION_PROPS | PORTAL_COLLISION_PORTAL | PORTAL_COLLISION_GROUND;
}

// Tunables
extern ConVar portal_mesh_depth;
extern ConVar portal_scale;
extern ConVar portal_prop_proximity;
extern ConVar portal_player_proximity;
extern ConVar portal_min_exit_speed;
extern ConVar portal_obstacle_trace_length;
extern ConVar portal_horizontal_tolerance;
extern ConVar portal_upright_tolerance;
extern ConVar portal_roll_correction_time;
extern ConVar portal_kinematic_window;
extern ConVar portal_fire_max_distance;
extern ConVar portal_camera_znear;
extern ConVar portal_camera_fov;
extern ConVar portal_physics_max_dt;
extern ConVar portal_physics_substeps;
extern ConVar portal_debug_teleport;
extern ConVar portal_debug_placement;

#endif // PORTAL_SHAREDDEFS_H
