//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
//=============================================================================//

#include "portal_shareddefs.h"

// memdbgon must be the last include file in a .cpp file!!!
#include "tier0/memdbgon.h"

ConVar portal_mesh_depth( "portal_mesh_depth", "0.5", FCVAR_REPLICATED | FCVAR_CHEAT, "Thickness of the portal volume. The clip plane sits this far in front of the portal origin." );
ConVar portal_scale( "portal_scale", "2", FCVAR_REPLICATED | FCVAR_CHEAT, "Uniform scale applied to newly placed portals." );
ConVar portal_prop_proximity( "portal_prop_proximity", "1.0", FCVAR_REPLICATED | FCVAR_CHEAT, "Distance to a clip plane below which a prop can be teleported." );
ConVar portal_player_proximity( "portal_player_proximity", "2.3", FCVAR_REPLICATED | FCVAR_CHEAT, "Distance to a clip plane below which the player can be teleported. Player origin is at the feet, hence the slack." );
ConVar portal_min_exit_speed( "portal_min_exit_speed", "3.0", FCVAR_REPLICATED | FCVAR_CHEAT, "Minimum speed out of the destination portal after a teleport." );
ConVar portal_obstacle_trace_length( "portal_obstacle_trace_length", "1.0", FCVAR_REPLICATED | FCVAR_CHEAT, "Length of the traces used to push a new portal away from nearby walls and edges." );
ConVar portal_horizontal_tolerance( "portal_horizontal_tolerance", "2.5", FCVAR_REPLICATED | FCVAR_CHEAT, "Max angle in degrees between a surface normal and vertical for the surface to count as a floor or ceiling." );
ConVar portal_upright_tolerance( "portal_upright_tolerance", "0.001", FCVAR_REPLICATED | FCVAR_CHEAT, "Per component tolerance on the player up vector before a teleport re-levels the player." );
ConVar portal_roll_correction_time( "portal_roll_correction_time", "0", FCVAR_REPLICATED | FCVAR_CHEAT, "Seconds taken to roll the player back upright after a teleport. 0 snaps immediately." );
ConVar portal_kinematic_window( "portal_kinematic_window", "0.1", FCVAR_REPLICATED | FCVAR_CHEAT, "Seconds the player body stays kinematic around a teleport." );
ConVar portal_fire_max_distance( "portal_fire_max_distance", "10000", FCVAR_REPLICATED | FCVAR_CHEAT, "Range of the portal placement trace." );
ConVar portal_camera_znear( "portal_camera_znear", "0.5", FCVAR_REPLICATED | FCVAR_CHEAT, "Near distance of the base perspective the oblique portal projection is built from." );
ConVar portal_camera_fov( "portal_camera_fov", "45", FCVAR_REPLICATED | FCVAR_CHEAT, "Vertical field of view, in degrees, of newly created portal cameras." );
ConVar portal_physics_max_dt( "portal_physics_max_dt", "0.05", FCVAR_REPLICATED | FCVAR_CHEAT, "Largest simulated step the host physics should take in one frame." );
ConVar portal_physics_substeps( "portal_physics_substeps", "4", FCVAR_REPLICATED | FCVAR_CHEAT, "Physics integration substeps per frame, so fast objects don't skip past a clip plane." );
ConVar portal_debug_teleport( "portal_debug_teleport", "0", FCVAR_REPLICATED, "Log every portal teleport." );
ConVar portal_debug_placement( "portal_debug_placement", "0", FCVAR_REPLICATED, "Log portal placement, camera creation and destruction." );
