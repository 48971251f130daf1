//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
// $NoKeywords: $
//=============================================================================//

#include "c_portal_camera.h"
#include "portal_shareddefs.h"
#include "mathlib/mathlib.h"
#include "tier0/dbg.h"

// memdbgon must be the last include file in a .cpp file!!!
#include "tier0/memdbgon.h"

static inline float Sign( float f )
{
	if ( f > 0.0f )
		return 1.0f;
	if ( f < 0.0f )
		return -1.0f;
	return 0.0f;
}

C_PortalCamera::C_PortalCamera( CProp_Portal *pOwnerPortal, CBaseHandle hEntity )
	: m_flFOV( portal_camera_fov.GetFloat() ),
	  m_flAspectRatio( PORTAL_CAMERA_DEFAULT_ASPECT ),
	  m_flFar( PORTAL_CAMERA_DEFAULT_FAR ),
	  m_pOwnerPortal( pOwnerPortal ),
	  m_hEntity( hEntity ),
	  m_vNear( 0.0f, 0.0f, -1.0f, -0.1f )
{
	SetIdentityMatrix( m_CameraToWorld );
}

void C_PortalCamera::SetCameraToWorld( const matrix3x4_t &cameraToWorld )
{
	MatrixCopy( cameraToWorld, m_CameraToWorld );
}

void C_PortalCamera::GetCameraToWorldView( VMatrix *pViewToWorld ) const
{
	// view x is camera right (-left), view y is camera up, view z is camera back
	VMatrix matViewToCamera(
		0.0f,  0.0f, -1.0f, 0.0f,
		-1.0f, 0.0f,  0.0f, 0.0f,
		0.0f,  1.0f,  0.0f, 0.0f,
		0.0f,  0.0f,  0.0f, 1.0f );

	*pViewToWorld = VMatrix( m_CameraToWorld ) * matViewToCamera;
}

void C_PortalCamera::GetViewMatrix( VMatrix *pWorldToView ) const
{
	VMatrix matViewToWorld;
	GetCameraToWorldView( &matViewToWorld );
	if ( !MatrixInverseGeneral( matViewToWorld, *pWorldToView ) )
	{
		AssertMsg( false, "Portal camera transform is singular" );
		pWorldToView->Identity();
	}
}

void C_PortalCamera::BuildPerspective( VMatrix *pProjection ) const
{
	float flFocal = 1.0f / tanf( DEG2RAD( m_flFOV ) * 0.5f );
	float flZNear = portal_camera_znear.GetFloat();

	pProjection->Init(
		flFocal / m_flAspectRatio,	0.0f,		0.0f,	0.0f,
		0.0f,						flFocal,	0.0f,	0.0f,
		0.0f,						0.0f,		-1.0f,	-flZNear,
		0.0f,						0.0f,		-1.0f,	0.0f );
}

void C_PortalCamera::GetProjectionMatrix( VMatrix *pProjection ) const
{
	BuildPerspective( pProjection );

	// Oblique near plane (Lengyel). q is the clip space corner opposite the near plane, pulled back
	// into view space. With an infinite far plane it's a direction (w = 0).
	const VMatrix &matProj = *pProjection;
	Vector4D q;
	q.x = Sign( m_vNear.x ) / matProj.m[0][0];
	q.y = Sign( m_vNear.y ) / matProj.m[1][1];
	q.z = -1.0f;
	q.w = 0.0f;

	float flNearDotQ = m_vNear.Dot( q );
	if ( fabs( flNearDotQ ) < 1e-6f )
	{
		AssertMsg( false, "Portal camera near plane is parallel to the view direction" );
		return;
	}

	Vector4D vRow3( matProj.m[3][0], matProj.m[3][1], matProj.m[3][2], matProj.m[3][3] );
	float flScale = vRow3.Dot( q ) / flNearDotQ;

	pProjection->m[2][0] = m_vNear.x * flScale;
	pProjection->m[2][1] = m_vNear.y * flScale;
	pProjection->m[2][2] = m_vNear.z * flScale;
	pProjection->m[2][3] = m_vNear.w * flScale;
}

void C_PortalCamera::Update( float flWidth, float flHeight )
{
	if ( flHeight == 0.0f )
		return;

	m_flAspectRatio = flWidth / flHeight;
}
