//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: Firing portals onto level geometry and keeping the two slots,
//			their link and their cameras consistent.
//
//=============================================================================//

#ifndef PORTAL_PLACEMENT_H
#define PORTAL_PLACEMENT_H
#ifdef _WIN32
#pragma once
#endif

#include "mathlib/vector.h"
#include "mathlib/mathlib.h"
#include "basehandle.h"
#include "portal_shareddefs.h"

class CProp_Portal;
class CPortal_CollisionGate;
class IPortalPhysicsWorld;
class IPortalSceneHost;

struct PortalPlacement_t
{
	matrix3x4_t			portalToWorld;
	PortalOrientation_t	orientation;
	Vector				vSurfacePoint;		//where the shot landed, after obstacle adjustment
};

// Works out where a portal shot lands without touching any portal. Only static geometry can
// take a portal.
PortalFizzleType_t TraceFirePortal( IPortalPhysicsWorld *pPhysics, const Vector &vTraceStart, const Vector &vDirection, PortalPlacement_t *pPlacement );

class CPortalPair
{
public:
	CPortalPair( IPortalPhysicsWorld *pPhysics, IPortalSceneHost *pScene, CPortal_CollisionGate *pGate );
	~CPortalPair( void );

	// Replaces whatever is in the slot. On a fizzle nothing changes.
	PortalFizzleType_t	FirePortal( PortalSlot_t slot, const Vector &vTraceStart, const Vector &vDirection, CBaseHandle *phPortal = NULL );
	void				RemovePortal( PortalSlot_t slot );
	void				RemoveAllPortals( void );

	// Gives every open portal without a camera one, once the main camera is known. Returns how many were made.
	int					CreatePortalCameras( void );

	// Cached first person camera, looked up again if it went away
	CBaseHandle			GetMainCamera( void );

	CProp_Portal*		GetPortal( PortalSlot_t slot ) const { return m_pPortals[slot]; }
	CProp_Portal* const* GetPortals( void ) const { return m_pPortals; }
	bool				IsLinked( void ) const;

private:
	void				UpdatePortalLinkage( void );
	void				RefreshSurfaceStates( void );

	IPortalPhysicsWorld		*m_pPhysics;
	IPortalSceneHost		*m_pScene;
	CPortal_CollisionGate	*m_pGate;

	CBaseHandle				m_hMainCamera;
	CProp_Portal			*m_pPortals[PORTAL_SLOT_COUNT];
};

#endif // PORTAL_PLACEMENT_H
