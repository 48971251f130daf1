//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: Scene and render side services the portal code needs from the host.
//
//=============================================================================//

#ifndef IPORTALSCENE_H
#define IPORTALSCENE_H
#ifdef _WIN32
#pragma once
#endif

#include "mathlib/mathlib.h"
#include "basehandle.h"
#include "portal_shareddefs.h"

abstract_class IPortalSceneHost
{
public:
	virtual ~IPortalSceneHost() {}

	// Propagated world transform of any entity
	virtual bool GetWorldTransform( CBaseHandle hEntity, matrix3x4_t &transform ) = 0;

	// Transform relative to the parent, used for the camera anchor under the player root
	virtual bool GetLocalTransform( CBaseHandle hEntity, matrix3x4_t &transform ) = 0;
	virtual void SetLocalTransform( CBaseHandle hEntity, const matrix3x4_t &transform ) = 0;

	// The first person camera that renders to the primary output, or an invalid handle if it
	// hasn't been spawned yet
	virtual CBaseHandle FindMainCamera() = 0;

	// Spawns the sensor volume and surface mesh for a portal
	virtual CBaseHandle CreatePortalEntity( PortalSlot_t slot, const matrix3x4_t &transform, PortalOrientation_t orientation ) = 0;

	// Spawns a camera rendering into the slot's offscreen target, which the portal surface samples.
	// Lower priorities render first.
	virtual CBaseHandle CreatePortalCamera( PortalSlot_t slot, int iRenderPriority ) = 0;

	// Removes an entity and its children
	virtual void DestroyEntity( CBaseHandle hEntity ) = 0;

	// Open portals show their camera's render target, closed portals show the idle surface
	virtual void SetPortalSurfaceState( CBaseHandle hPortal, bool bOpen ) = 0;
};

#endif // IPORTALSCENE_H
