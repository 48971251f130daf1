//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
//=============================================================================//

#include "portal_player_shared.h"
#include "portal_util_shared.h"
#include "iportalphysics.h"
#include "iportalscene.h"
#include "mathlib/mathlib.h"
#include "tier0/dbg.h"

// memdbgon must be the last include file in a .cpp file!!!
#include "tier0/memdbgon.h"

CPortalPlayerState::CPortalPlayerState( void )
	: m_flYaw( 0.0f ),
	  m_flPitch( 0.0f ),
	  m_bCameraLocked( false ),
	  m_flRollDuration( 0.0f ),
	  m_flRollRemaining( 0.0f ),
	  m_flKinematicCountdown( 0.0f ),
	  m_bKinematic( false )
{
	m_qRollStart.Init( 0.0f, 0.0f, 0.0f, 1.0f );
	m_qRollEnd.Init( 0.0f, 0.0f, 0.0f, 1.0f );
	m_qCameraStart.Init( 0.0f, 0.0f, 0.0f, 1.0f );
	m_qCameraEnd.Init( 0.0f, 0.0f, 0.0f, 1.0f );
	m_vecCameraOffset.Init();
}

void CPortalPlayerState::Init( CBaseHandle hBody, CBaseHandle hCameraAnchor )
{
	m_hBody = hBody;
	m_hCameraAnchor = hCameraAnchor;
}

bool CPortalPlayerState::StartRollCorrection( const matrix3x4_t &rawRoot, const matrix3x4_t &levelRoot, const matrix3x4_t &rawCameraLocal, const matrix3x4_t &levelCameraLocal, float flDuration )
{
	if ( flDuration <= 0.0f )
		return false;

	MatrixQuaternion( rawRoot, m_qRollStart );
	MatrixQuaternion( levelRoot, m_qRollEnd );
	MatrixQuaternion( rawCameraLocal, m_qCameraStart );
	MatrixQuaternion( levelCameraLocal, m_qCameraEnd );
	MatrixGetColumn( levelCameraLocal, 3, m_vecCameraOffset );
	m_flRollDuration = flDuration;
	m_flRollRemaining = flDuration;
	m_bCameraLocked = true;
	return true;
}

bool CPortalPlayerState::AnimateRoll( IPortalPhysicsWorld *pPhysics, IPortalSceneHost *pScene, float flFrameTime )
{
	if ( m_flRollRemaining <= 0.0f )
		return false;

	matrix3x4_t root;
	if ( !pPhysics->GetBodyTransform( m_hBody, root ) )
	{
		// body is gone, nothing left to level
		m_flRollRemaining = 0.0f;
		m_bCameraLocked = false;
		return false;
	}

	Quaternion qRoot, qCamera;
	if ( flFrameTime >= m_flRollRemaining )
	{
		qRoot = m_qRollEnd;
		qCamera = m_qCameraEnd;
		m_flRollRemaining = 0.0f;
		m_bCameraLocked = false;
	}
	else
	{
		m_flRollRemaining -= flFrameTime;
		float flFraction = 1.0f - ( m_flRollRemaining / m_flRollDuration );
		QuaternionSlerp( m_qRollStart, m_qRollEnd, flFraction, qRoot );
		QuaternionSlerp( m_qCameraStart, m_qCameraEnd, flFraction, qCamera );
	}

	QuaternionMatrix( qRoot, UTIL_Portal_Origin( root ), root );
	pPhysics->SetBodyTransform( m_hBody, root );

	// anchor turns with the root
	matrix3x4_t cameraLocal;
	QuaternionMatrix( qCamera, m_vecCameraOffset, cameraLocal );
	pScene->SetLocalTransform( m_hCameraAnchor, cameraLocal );

	return IsRollCorrecting();
}

void CPortalPlayerState::ResetKinematicWindow( IPortalPhysicsWorld *pPhysics )
{
	m_flKinematicCountdown = portal_kinematic_window.GetFloat();

	if ( !m_bKinematic )
	{
		pPhysics->SetBodyMotionMode( m_hBody, PORTAL_BODY_KINEMATIC );
		m_bKinematic = true;
	}
}

void CPortalPlayerState::UpdateKinematicWindow( IPortalPhysicsWorld *pPhysics, float flFrameTime )
{
	if ( !m_bKinematic )
		return;

	m_flKinematicCountdown -= flFrameTime;
	if ( m_flKinematicCountdown > 0.0f )
		return;

	m_flKinematicCountdown = 0.0f;
	pPhysics->SetBodyMotionMode( m_hBody, PORTAL_BODY_DYNAMIC );
	m_bKinematic = false;
}

bool AdjustPlayerCameraOnTeleport( const VMatrix &matTeleport, const matrix3x4_t &cameraToWorld, matrix3x4_t &cameraLocal, matrix3x4_t &playerRoot, CPortalPlayerState &state )
{
	matrix3x4_t rawRoot;
	UTIL_Portal_TransformPose( matTeleport, playerRoot, rawRoot );
	MatrixCopy( rawRoot, playerRoot );

	Vector ptRootOrigin = UTIL_Portal_Origin( playerRoot );

	if ( UTIL_Portal_IsUpright( playerRoot, portal_upright_tolerance.GetFloat() ) )
	{
		// still level, just keep the stored yaw in step with the root
		Vector vRootForward = UTIL_Portal_Forward( playerRoot );
		state.m_flYaw = RAD2DEG( atan2f( vRootForward.y, vRootForward.x ) );
		return false;
	}

	// Where the player was looking once carried through the portal
	Vector vCameraForward;
	MatrixGetColumn( cameraToWorld, 0, vCameraForward );
	VectorNormalize( vCameraForward );
	Vector vLook = matTeleport.ApplyRotation( vCameraForward );
	VectorNormalize( vLook );

	float flHorizontal = sqrtf( vLook.x * vLook.x + vLook.y * vLook.y );

	float flYaw = 0.0f;
	if ( flHorizontal > PORTAL_DEGENERATE_EPSILON )
		flYaw = RAD2DEG( atan2f( vLook.y, vLook.x ) );

	float flPitch = 0.0f;
	if ( fabs( vLook.z ) > PORTAL_DEGENERATE_EPSILON )
		flPitch = -RAD2DEG( atan2f( vLook.z, flHorizontal ) );

	AngleMatrix( QAngle( 0.0f, flYaw, 0.0f ), ptRootOrigin, playerRoot );

	Vector ptAnchorOrigin;
	MatrixGetColumn( cameraLocal, 3, ptAnchorOrigin );
	AngleMatrix( QAngle( flPitch, 0.0f, 0.0f ), ptAnchorOrigin, cameraLocal );

	state.m_flYaw = flYaw;
	state.m_flPitch = flPitch;

	return true;
}
