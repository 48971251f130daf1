//========= Copyright Valve Corporation, All rights reserved. ============//
//
// Purpose: Portal firing, slot replacement, linkage and camera lifecycle
//
//=============================================================================//

#include <gtest/gtest.h>

#include "portal_placement.h"
#include "portal_collision_gating.h"
#include "prop_portal_shared.h"
#include "c_portal_camera.h"
#include "fake_portal_host.h"

namespace
{

void ExpectVectorNear( const Vector &expected, const Vector &actual, float flTolerance )
{
	EXPECT_NEAR( expected.x, actual.x, flTolerance );
	EXPECT_NEAR( expected.y, actual.y, flTolerance );
	EXPECT_NEAR( expected.z, actual.z, flTolerance );
}

} // namespace

class PortalPlacementTest : public ::testing::Test
{
protected:
	PortalPlacementTest()
		: m_Pair( &m_Physics, &m_Scene, &m_Gate )
	{
	}

	void SetUp()
	{
		// wall facing -X and a floor
		m_Physics.AddBox( Vector( 10, -20, -1 ), Vector( 11, 20, 20 ), PORTAL_COLLISION_WALLS );
		m_Physics.AddBox( Vector( -20, -20, -1 ), Vector( 10, 20, 0 ), PORTAL_COLLISION_GROUND );
	}

	CFakePhysicsWorld		m_Physics;
	CFakeSceneHost			m_Scene;
	CPortal_CollisionGate	m_Gate;
	CPortalPair				m_Pair;
};

TEST_F( PortalPlacementTest, TraceOntoWall )
{
	PortalPlacement_t placement;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, TraceFirePortal( &m_Physics, Vector( 0, 0, 5 ), Vector( 1, 0, 0 ), &placement ) );

	EXPECT_EQ( PORTAL_ORIENTATION_OTHER, placement.orientation );
	ExpectVectorNear( Vector( 9.999f, 0, 5 ), placement.vSurfacePoint, 1e-4f );

	ExpectVectorNear( Vector( -1, 0, 0 ), UTIL_Portal_Forward( placement.portalToWorld ), 1e-5f );
	ExpectVectorNear( Vector( 0, 0, 1 ), UTIL_Portal_Up( placement.portalToWorld ), 1e-5f );

	// clip plane on the surface, origin sunk into the wall
	ExpectVectorNear( Vector( 9.999f, 0, 5 ), UTIL_Portal_ClipPoint( placement.portalToWorld ), 1e-4f );
	ExpectVectorNear( Vector( 10.499f, 0, 5 ), UTIL_Portal_Origin( placement.portalToWorld ), 1e-4f );

	// scaled basis
	Vector vColumn;
	MatrixGetColumn( placement.portalToWorld, 0, vColumn );
	EXPECT_NEAR( portal_scale.GetFloat(), vColumn.Length(), 1e-4f );
}

TEST_F( PortalPlacementTest, TraceNormalizesTheShotDirection )
{
	PortalPlacement_t placement;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, TraceFirePortal( &m_Physics, Vector( 0, 0, 5 ), Vector( 7, 0, 0 ), &placement ) );
	ExpectVectorNear( Vector( 9.999f, 0, 5 ), placement.vSurfacePoint, 1e-4f );
}

TEST_F( PortalPlacementTest, TraceOntoFloorUsesShotHeading )
{
	PortalPlacement_t placement;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, TraceFirePortal( &m_Physics, Vector( 0, 0, 5 ), Vector( 1, 0, -1 ), &placement ) );

	EXPECT_EQ( PORTAL_ORIENTATION_HORIZONTAL, placement.orientation );
	ExpectVectorNear( Vector( 5, 0, 0.001f ), placement.vSurfacePoint, 1e-4f );
	ExpectVectorNear( Vector( 0, 0, 1 ), UTIL_Portal_Forward( placement.portalToWorld ), 1e-5f );
	ExpectVectorNear( Vector( 1, 0, 0 ), UTIL_Portal_Up( placement.portalToWorld ), 1e-5f );
}

TEST_F( PortalPlacementTest, TraceNearFloorIsPushedUp )
{
	PortalPlacement_t placement;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, TraceFirePortal( &m_Physics, Vector( 0, 0, 0.25f ), Vector( 1, 0, 0 ), &placement ) );
	ExpectVectorNear( Vector( 9.999f, 0, 1.0f ), placement.vSurfacePoint, 1e-4f );
}

TEST_F( PortalPlacementTest, TraceFizzles )
{
	PortalPlacement_t placement;

	// nothing there
	EXPECT_EQ( PORTAL_FIZZLE_NONE, TraceFirePortal( &m_Physics, Vector( 0, 0, 5 ), Vector( -1, 0, 0 ), &placement ) );

	// no heading to orient a floor portal with
	EXPECT_EQ( PORTAL_FIZZLE_BAD_SURFACE, TraceFirePortal( &m_Physics, Vector( 0, 0, 5 ), Vector( 0, 0, -1 ), &placement ) );

	// no direction at all
	EXPECT_EQ( PORTAL_FIZZLE_NONE, TraceFirePortal( &m_Physics, Vector( 0, 0, 5 ), vec3_origin, &placement ) );
}

TEST_F( PortalPlacementTest, PropsDontTakePortals )
{
	m_Physics.AddBox( Vector( 4, -1, 4 ), Vector( 5, 1, 6 ), PORTAL_COLLISION_PROPS );

	PortalPlacement_t placement;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, TraceFirePortal( &m_Physics, Vector( 0, 0, 5 ), Vector( 1, 0, 0 ), &placement ) );
	ExpectVectorNear( Vector( 9.999f, 0, 5 ), placement.vSurfacePoint, 1e-4f );
}

TEST_F( PortalPlacementTest, FirstPortalIsClosed )
{
	CBaseHandle hPortal;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, 0, 5 ), Vector( 1, 0, 0 ), &hPortal ) );

	ASSERT_TRUE( m_Pair.GetPortal( PORTAL_SLOT_A ) != NULL );
	EXPECT_TRUE( m_Pair.GetPortal( PORTAL_SLOT_B ) == NULL );
	EXPECT_FALSE( m_Pair.IsLinked() );
	EXPECT_FALSE( m_Pair.GetPortal( PORTAL_SLOT_A )->IsActivatedAndLinked() );

	EXPECT_TRUE( m_Scene.Exists( hPortal ) );
	EXPECT_EQ( hPortal, m_Pair.GetPortal( PORTAL_SLOT_A )->GetEntityHandle() );
	EXPECT_FALSE( m_Scene.GetEntity( hPortal ).bOpen );
}

TEST_F( PortalPlacementTest, SecondPortalLinksAndOpensBoth )
{
	CBaseHandle hPortalA, hPortalB;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, 0, 5 ), Vector( 1, 0, 0 ), &hPortalA ) );
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_B, Vector( 0, 3, 5 ), Vector( 1, 0, 0 ), &hPortalB ) );

	CProp_Portal *pPortalA = m_Pair.GetPortal( PORTAL_SLOT_A );
	CProp_Portal *pPortalB = m_Pair.GetPortal( PORTAL_SLOT_B );
	EXPECT_TRUE( m_Pair.IsLinked() );
	EXPECT_EQ( pPortalB, pPortalA->GetLinkedPortal() );
	EXPECT_EQ( pPortalA, pPortalB->GetLinkedPortal() );

	EXPECT_TRUE( m_Scene.GetEntity( hPortalA ).bOpen );
	EXPECT_TRUE( m_Scene.GetEntity( hPortalB ).bOpen );
}

TEST_F( PortalPlacementTest, FizzleLeavesTheSlotAlone )
{
	CBaseHandle hPortal;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, 0, 5 ), Vector( 1, 0, 0 ), &hPortal ) );
	CProp_Portal *pPortal = m_Pair.GetPortal( PORTAL_SLOT_A );

	EXPECT_EQ( PORTAL_FIZZLE_NONE, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, 0, 5 ), Vector( -1, 0, 0 ) ) );
	EXPECT_EQ( pPortal, m_Pair.GetPortal( PORTAL_SLOT_A ) );
	EXPECT_TRUE( m_Scene.Exists( hPortal ) );
	EXPECT_EQ( 1, m_Scene.m_nPortalsCreated );
}

TEST_F( PortalPlacementTest, FailedCreationKeepsTheOldPortal )
{
	m_Scene.m_hMainCamera = m_Scene.AddEntity( MakePose( Vector( 0, 0, 5 ) ), MakePose( vec3_origin ) );

	CBaseHandle hPortalA, hPortalB;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, 0, 5 ), Vector( 1, 0, 0 ), &hPortalA ) );
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_B, Vector( 0, 3, 5 ), Vector( 1, 0, 0 ), &hPortalB ) );
	ASSERT_EQ( 2, m_Pair.CreatePortalCameras() );

	CProp_Portal *pPortalA = m_Pair.GetPortal( PORTAL_SLOT_A );
	C_PortalCamera *pCameraA = pPortalA->GetCamera();
	int nDestroyed = m_Scene.m_nDestroyed;

	m_Scene.m_bFailPortalCreation = true;
	CBaseHandle hUnused;
	EXPECT_EQ( PORTAL_FIZZLE_BAD_SURFACE, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, -4, 5 ), Vector( 1, 0, 0 ), &hUnused ) );
	EXPECT_FALSE( hUnused.IsValid() );

	// nothing torn down, still linked and open
	EXPECT_EQ( nDestroyed, m_Scene.m_nDestroyed );
	EXPECT_EQ( pPortalA, m_Pair.GetPortal( PORTAL_SLOT_A ) );
	EXPECT_EQ( pCameraA, pPortalA->GetCamera() );
	EXPECT_TRUE( m_Scene.Exists( hPortalA ) );
	EXPECT_TRUE( m_Pair.IsLinked() );
	EXPECT_TRUE( m_Scene.GetEntity( hPortalA ).bOpen );
	ExpectVectorNear( Vector( 9.999f, 0, 5 ), pPortalA->m_ptClipPoint, 1e-4f );

	m_Scene.m_bFailPortalCreation = false;
}

TEST_F( PortalPlacementTest, CamerasWaitForTheMainCamera )
{
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, 0, 5 ), Vector( 1, 0, 0 ) ) );
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_B, Vector( 0, 3, 5 ), Vector( 1, 0, 0 ) ) );

	EXPECT_EQ( 0, m_Pair.CreatePortalCameras() );
	EXPECT_EQ( 0, m_Scene.CountCameras() );

	m_Scene.m_hMainCamera = m_Scene.AddEntity( MakePose( Vector( 0, 0, 5 ) ), MakePose( vec3_origin ) );
	EXPECT_EQ( 2, m_Pair.CreatePortalCameras() );
	EXPECT_EQ( 2, m_Scene.CountCameras() );

	C_PortalCamera *pCameraA = m_Pair.GetPortal( PORTAL_SLOT_A )->GetCamera();
	C_PortalCamera *pCameraB = m_Pair.GetPortal( PORTAL_SLOT_B )->GetCamera();
	ASSERT_TRUE( pCameraA != NULL );
	ASSERT_TRUE( pCameraB != NULL );
	EXPECT_EQ( m_Pair.GetPortal( PORTAL_SLOT_A ), pCameraA->GetOwnerPortal() );

	// both render before the main camera, A first
	EXPECT_EQ( -1, m_Scene.GetEntity( pCameraA->GetEntityHandle() ).iRenderPriority );
	EXPECT_EQ( -2, m_Scene.GetEntity( pCameraB->GetEntityHandle() ).iRenderPriority );

	// already have one
	EXPECT_EQ( 0, m_Pair.CreatePortalCameras() );
	EXPECT_EQ( 2, m_Scene.CountCameras() );
}

TEST_F( PortalPlacementTest, RefiringReplacesPortalAndCamera )
{
	m_Scene.m_hMainCamera = m_Scene.AddEntity( MakePose( Vector( 0, 0, 5 ) ), MakePose( vec3_origin ) );

	CBaseHandle hFirst, hSecond;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, 0, 5 ), Vector( 1, 0, 0 ), &hFirst ) );
	ASSERT_EQ( 1, m_Pair.CreatePortalCameras() );
	CBaseHandle hFirstCamera = m_Pair.GetPortal( PORTAL_SLOT_A )->GetCamera()->GetEntityHandle();

	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, 4, 5 ), Vector( 1, 0, 0 ), &hSecond ) );

	EXPECT_FALSE( m_Scene.Exists( hFirst ) );
	EXPECT_FALSE( m_Scene.Exists( hFirstCamera ) );
	EXPECT_TRUE( m_Scene.Exists( hSecond ) );
	EXPECT_EQ( 1, m_Scene.CountPortals( PORTAL_SLOT_A ) );
	EXPECT_EQ( 0, m_Scene.CountCameras() );
	EXPECT_TRUE( m_Pair.GetPortal( PORTAL_SLOT_A )->GetCamera() == NULL );

	ExpectVectorNear( Vector( 9.999f, 4, 5 ), m_Pair.GetPortal( PORTAL_SLOT_A )->m_ptClipPoint, 1e-4f );

	EXPECT_EQ( 1, m_Pair.CreatePortalCameras() );
	EXPECT_EQ( 1, m_Scene.CountCameras() );
}

TEST_F( PortalPlacementTest, RefiringKeepsTheLink )
{
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, 0, 5 ), Vector( 1, 0, 0 ) ) );
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_B, Vector( 0, 3, 5 ), Vector( 1, 0, 0 ) ) );
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_B, Vector( 0, -3, 5 ), Vector( 1, 0, 0 ) ) );

	EXPECT_TRUE( m_Pair.IsLinked() );
	EXPECT_EQ( m_Pair.GetPortal( PORTAL_SLOT_B ), m_Pair.GetPortal( PORTAL_SLOT_A )->GetLinkedPortal() );
	EXPECT_EQ( 1, m_Scene.CountPortals( PORTAL_SLOT_B ) );
}

TEST_F( PortalPlacementTest, RemovingAPortalClosesTheOther )
{
	CBaseHandle hPortalA, hPortalB;
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_A, Vector( 0, 0, 5 ), Vector( 1, 0, 0 ), &hPortalA ) );
	ASSERT_EQ( PORTAL_FIZZLE_SUCCESS, m_Pair.FirePortal( PORTAL_SLOT_B, Vector( 0, 3, 5 ), Vector( 1, 0, 0 ), &hPortalB ) );

	m_Pair.RemovePortal( PORTAL_SLOT_B );

	EXPECT_FALSE( m_Pair.IsLinked() );
	EXPECT_TRUE( m_Pair.GetPortal( PORTAL_SLOT_B ) == NULL );
	EXPECT_TRUE( m_Pair.GetPortal( PORTAL_SLOT_A )->GetLinkedPortal() == NULL );
	EXPECT_FALSE( m_Scene.Exists( hPortalB ) );
	EXPECT_FALSE( m_Scene.GetEntity( hPortalA ).bOpen );

	// removing an empty slot does nothing
	int nDestroyed = m_Scene.m_nDestroyed;
	m_Pair.RemovePortal( PORTAL_SLOT_B );
	EXPECT_EQ( nDestroyed, m_Scene.m_nDestroyed );
}

TEST_F( PortalPlacementTest, MainCameraIsLookedUpAgainWhenLost )
{
	CBaseHandle hFirst = m_Scene.AddEntity( MakePose( vec3_origin ), MakePose( vec3_origin ) );
	m_Scene.m_hMainCamera = hFirst;
	EXPECT_EQ( hFirst, m_Pair.GetMainCamera() );

	m_Scene.DestroyEntity( hFirst );
	CBaseHandle hSecond = m_Scene.AddEntity( MakePose( vec3_origin ), MakePose( vec3_origin ) );
	m_Scene.m_hMainCamera = hSecond;
	EXPECT_EQ( hSecond, m_Pair.GetMainCamera() );

	m_Scene.DestroyEntity( hSecond );
	EXPECT_FALSE( m_Pair.GetMainCamera().IsValid() );
}
