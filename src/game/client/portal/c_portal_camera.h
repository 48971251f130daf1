//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: Virtual camera that renders the view through a portal into the
//			portal's offscreen target. Owned by its portal.
//
// $NoKeywords: $
//=============================================================================//

#ifndef C_PORTAL_CAMERA_H
#define C_PORTAL_CAMERA_H

#ifdef _WIN32
#pragma once
#endif

#include "mathlib/vector.h"
#include "mathlib/vector4d.h"
#include "mathlib/vmatrix.h"
#include "basehandle.h"

class CProp_Portal;

#define PORTAL_CAMERA_DEFAULT_ASPECT	( 16.0f / 9.0f )
#define PORTAL_CAMERA_DEFAULT_FAR		1000.0f

class C_PortalCamera
{
public:
							C_PortalCamera( CProp_Portal *pOwnerPortal, CBaseHandle hEntity );

	CProp_Portal*			GetOwnerPortal( void ) const { return m_pOwnerPortal; }
	CBaseHandle				GetEntityHandle( void ) const { return m_hEntity; }

	void					SetCameraToWorld( const matrix3x4_t &cameraToWorld );
	const matrix3x4_t&		CameraToWorld( void ) const { return m_CameraToWorld; }

	// View space is x right, y up, z toward the viewer
	void					GetCameraToWorldView( VMatrix *pViewToWorld ) const;
	void					GetViewMatrix( VMatrix *pWorldToView ) const;

	// Infinite perspective with a [0,1] depth range whose near plane is replaced by m_vNear
	void					GetProjectionMatrix( VMatrix *pProjection ) const;

	// Viewport resize
	void					Update( float flWidth, float flHeight );

	void					SetNearPlane( const Vector4D &vNear ) { m_vNear = vNear; }
	const Vector4D&			GetNearPlane( void ) const { return m_vNear; }

	float					m_flFOV;			//vertical, degrees
	float					m_flAspectRatio;
	float					m_flFar;

private:
	void					BuildPerspective( VMatrix *pProjection ) const;

	CProp_Portal			*m_pOwnerPortal;
	CBaseHandle				m_hEntity;
	matrix3x4_t				m_CameraToWorld;
	Vector4D				m_vNear;			//oblique clip plane in view space, positive side is visible
};

#endif //C_PORTAL_CAMERA_H
