//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: Owns the portal pair and everything that interacts with it, and runs
//			the per frame portal pipeline in order.
//
//=============================================================================//

#ifndef PORTAL_SYSTEM_H
#define PORTAL_SYSTEM_H
#ifdef _WIN32
#pragma once
#endif

#include "mathlib/vector.h"
#include "tier1/utlvector.h"
#include "basehandle.h"
#include "portal_shareddefs.h"
#include "portal_placement.h"
#include "portal_collision_gating.h"
#include "portal_player_shared.h"

class IPortalPhysicsWorld;
class IPortalSceneHost;

#define IN_FIRE_PORTAL_A	(1 << 0)
#define IN_FIRE_PORTAL_B	(1 << 1)

// Fire buttons and aim for the frame. A press fires once no matter how long it's held.
class CPortalFireInput
{
public:
	CPortalFireInput( void );

	void		Update( int nButtons, const Vector &vAimOrigin, const Vector &vAimDirection );

	// Buttons that went down since the last call
	int			ConsumePressed( void );

	const Vector&	GetAimOrigin( void ) const { return m_vAimOrigin; }
	const Vector&	GetAimDirection( void ) const { return m_vAimDirection; }

private:
	int			m_nButtons;
	int			m_nOldButtons;
	Vector		m_vAimOrigin;
	Vector		m_vAimDirection;
};

class CPortalSystem
{
public:
	CPortalSystem( IPortalPhysicsWorld *pPhysics, IPortalSceneHost *pScene );
	~CPortalSystem( void );

	void					AddTeleportable( CBaseHandle hEntity, PortalTeleportableType_t type );
	void					RemoveTeleportable( CBaseHandle hEntity );
	bool					IsTeleportable( CBaseHandle hEntity ) const;
	const CUtlVector<PortalTeleportable_t>& GetTeleportables( void ) const { return m_Teleportables; }

	// Registers the player body as a teleportable too
	void					SetPlayer( CBaseHandle hBody, CBaseHandle hCameraAnchor );

	void					RunFrame( float flFrameTime );

	// Stages of RunFrame
	void					RunPlacement( void );
	int						RunCameraCreation( void );
	bool					RunCameraSync( void );
	void					RunCollisionGating( void );
	int						RunTeleport( void );
	void					RunRollAnimation( float flFrameTime );
	void					RunKinematicCountdown( float flFrameTime );

	// Step the host physics should use for this frame
	void					GetPhysicsTimestep( float flFrameTime, float *pflStep, int *pnSubsteps ) const;

	CPortalFireInput&		GetFireInput( void ) { return m_FireInput; }
	CPortalPair&			GetPortalPair( void ) { return m_PortalPair; }
	CPortal_CollisionGate&	GetCollisionGate( void ) { return m_CollisionGate; }
	CPortalPlayerState&		GetPlayerState( void ) { return m_PlayerState; }

private:
	IPortalPhysicsWorld		*m_pPhysics;
	IPortalSceneHost		*m_pScene;

	CPortal_CollisionGate	m_CollisionGate;
	CPortalPair				m_PortalPair;
	CPortalPlayerState		m_PlayerState;
	CPortalFireInput		m_FireInput;

	CUtlVector<PortalTeleportable_t>	m_Teleportables;
};

#endif // PORTAL_SYSTEM_H
