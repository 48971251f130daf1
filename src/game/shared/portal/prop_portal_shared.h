//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: One end of a linked portal pair.
//
// $NoKeywords: $
//=============================================================================//

#ifndef PROP_PORTAL_SHARED_H
#define PROP_PORTAL_SHARED_H

#ifdef _WIN32
#pragma once
#endif

#include "mathlib/vector.h"
#include "mathlib/vector4d.h"
#include "mathlib/vmatrix.h"
#include "basehandle.h"
#include "portal_shareddefs.h"

class C_PortalCamera;

class CProp_Portal
{
public:
							CProp_Portal( PortalSlot_t slot, CBaseHandle hEntity );
							~CProp_Portal( void );

	PortalSlot_t			GetSlot( void ) const { return m_Slot; }
	CBaseHandle				GetEntityHandle( void ) const { return m_hEntity; }

	void					PlacePortal( const matrix3x4_t &portalToWorld, PortalOrientation_t orientation );
	const matrix3x4_t&		PortalToWorld( void ) const { return m_PortalToWorld; }
	PortalOrientation_t		GetOrientation( void ) const { return m_Orientation; }

	CProp_Portal*			GetLinkedPortal( void ) const { return m_pLinkedPortal; }
	void					SetLinkedPortal( CProp_Portal *pLinked ) { m_pLinkedPortal = pLinked; }
	bool					IsActivatedAndLinked( void ) const { return m_pLinkedPortal != NULL; }

	// The portal owns its camera once one has been attached
	C_PortalCamera*			GetCamera( void ) const { return m_pCamera; }
	void					AttachCamera( C_PortalCamera *pCamera );
	C_PortalCamera*			DetachCamera( void );

	Vector4D				GetPortalPlane( void ) const { return m_plane_Origin; }

	// Cached from the transform on placement
	Vector					m_ptOrigin;
	Vector					m_ptClipPoint;
	Vector					m_vForward, m_vUp, m_vRight;
	Vector4D				m_plane_Origin; //plane through the clip point, normal out of the wall

private:
	void					UpdateCachedVectors( void );

	PortalSlot_t			m_Slot;
	CBaseHandle				m_hEntity;
	matrix3x4_t				m_PortalToWorld;
	PortalOrientation_t		m_Orientation;
	CProp_Portal			*m_pLinkedPortal;
	C_PortalCamera			*m_pCamera;
};

#endif //#ifndef PROP_PORTAL_SHARED_H
