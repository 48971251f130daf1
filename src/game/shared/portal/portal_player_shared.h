//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: Player side of portal teleportation. Re-levels the player after a
//			teleport through a pair that changes which way is up.
//
// $NoKeywords: $
//
//=============================================================================//
#ifndef PORTAL_PLAYER_SHARED_H
#define PORTAL_PLAYER_SHARED_H
#ifdef _WIN32
#pragma once
#endif

#include "mathlib/vector.h"
#include "mathlib/vmatrix.h"
#include "basehandle.h"
#include "portal_shareddefs.h"

class IPortalPhysicsWorld;
class IPortalSceneHost;

class CPortalPlayerState
{
public:
	CPortalPlayerState( void );

	void		Init( CBaseHandle hBody, CBaseHandle hCameraAnchor );
	bool		IsValid( void ) const { return m_hBody.IsValid(); }

	// Roll back to level after a teleport. The root goes from rawRoot to levelRoot while the
	// camera anchor goes from rawCameraLocal to levelCameraLocal, so the view starts and ends
	// on the carried through look direction. Returns true while the animation is still running.
	bool		StartRollCorrection( const matrix3x4_t &rawRoot, const matrix3x4_t &levelRoot, const matrix3x4_t &rawCameraLocal, const matrix3x4_t &levelCameraLocal, float flDuration );
	bool		AnimateRoll( IPortalPhysicsWorld *pPhysics, IPortalSceneHost *pScene, float flFrameTime );
	bool		IsRollCorrecting( void ) const { return m_flRollRemaining > 0.0f; }

	// Kinematic body window around a teleport
	void		ResetKinematicWindow( IPortalPhysicsWorld *pPhysics );
	void		UpdateKinematicWindow( IPortalPhysicsWorld *pPhysics, float flFrameTime );
	bool		IsKinematic( void ) const { return m_bKinematic; }

	CBaseHandle	m_hBody;
	CBaseHandle	m_hCameraAnchor;

	// Look angles driven by mouse input, degrees
	float		m_flYaw;
	float		m_flPitch;

	// Set while the roll correction owns the view
	bool		m_bCameraLocked;

	Quaternion	m_qRollStart;
	Quaternion	m_qRollEnd;
	Quaternion	m_qCameraStart;
	Quaternion	m_qCameraEnd;
	Vector		m_vecCameraOffset;
	float		m_flRollDuration;
	float		m_flRollRemaining;

	float		m_flKinematicCountdown;
	bool		m_bKinematic;
};

// Applies matTeleport to the player root and, if that leaves the player tilted, rebuilds it
// as yaw only with the pitch moved onto the camera anchor so the view direction doesn't change.
// cameraToWorld is the camera pose from before the teleport. Returns true if the player was re-leveled.
bool AdjustPlayerCameraOnTeleport( const VMatrix &matTeleport, const matrix3x4_t &cameraToWorld, matrix3x4_t &cameraLocal, matrix3x4_t &playerRoot, CPortalPlayerState &state );

#endif //PORTAL_PLAYER_SHARED_H
