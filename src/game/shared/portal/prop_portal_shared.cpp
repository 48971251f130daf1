//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose:
//
// $NoKeywords: $
//=============================================================================//

#include "prop_portal_shared.h"
#include "portal_util_shared.h"
#include "c_portal_camera.h"
#include "tier0/dbg.h"

// memdbgon must be the last include file in a .cpp file!!!
#include "tier0/memdbgon.h"

CProp_Portal::CProp_Portal( PortalSlot_t slot, CBaseHandle hEntity )
	: m_Slot( slot ),
	  m_hEntity( hEntity ),
	  m_Orientation( PORTAL_ORIENTATION_OTHER ),
	  m_pLinkedPortal( NULL ),
	  m_pCamera( NULL )
{
	SetIdentityMatrix( m_PortalToWorld );
	UpdateCachedVectors();
}

CProp_Portal::~CProp_Portal( void )
{
	AssertMsg( m_pLinkedPortal == NULL || m_pLinkedPortal->GetLinkedPortal() != this, "Portal destroyed while still linked" );

	delete m_pCamera;
	m_pCamera = NULL;
}

void CProp_Portal::PlacePortal( const matrix3x4_t &portalToWorld, PortalOrientation_t orientation )
{
	MatrixCopy( portalToWorld, m_PortalToWorld );
	m_Orientation = orientation;
	UpdateCachedVectors();
}

void CProp_Portal::AttachCamera( C_PortalCamera *pCamera )
{
	AssertMsg( m_pCamera == NULL, "Portal already has a camera" );
	AssertMsg( pCamera->GetOwnerPortal() == this, "Camera belongs to another portal" );
	m_pCamera = pCamera;
}

C_PortalCamera *CProp_Portal::DetachCamera( void )
{
	C_PortalCamera *pCamera = m_pCamera;
	m_pCamera = NULL;
	return pCamera;
}

void CProp_Portal::UpdateCachedVectors( void )
{
	m_ptOrigin = UTIL_Portal_Origin( m_PortalToWorld );
	m_vForward = UTIL_Portal_Forward( m_PortalToWorld );
	m_vUp = UTIL_Portal_Up( m_PortalToWorld );
	m_vRight = CrossProduct( m_vForward, m_vUp );
	m_ptClipPoint = UTIL_Portal_ClipPoint( m_PortalToWorld );
	m_plane_Origin = UTIL_Portal_GetPortalPlane( m_PortalToWorld );
}
